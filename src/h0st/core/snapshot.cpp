#include "snapshot.hpp"

#include <redlog.hpp>

#include "util/string_utils.hpp"
#include "verbosity.hpp"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <cstdio>
#include <optional>
#else
#include <sys/utsname.h>
#endif

namespace h0st {

namespace {

std::string compiled_operating_system() {
#ifdef __APPLE__
  return "darwin";
#elif __linux__
  return "linux";
#elif _WIN32
  return "windows";
#elif __FreeBSD__
  return "freebsd";
#elif __OpenBSD__
  return "openbsd";
#elif __NetBSD__
  return "netbsd";
#elif __DragonFly__
  return "dragonfly";
#elif __sun
  return "sunos";
#elif __CYGWIN__
  return "cygwin";
#elif __MVS__
  return "z/os";
#else
  return "unknown";
#endif
}

std::string compiled_architecture() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "aarch64";
#elif defined(__i386__) || defined(_M_IX86)
  return "x86";
#elif defined(__arm__) || defined(_M_ARM)
  return "arm";
#elif defined(__riscv) && (__riscv_xlen == 64)
  return "riscv64";
#elif defined(__riscv) && (__riscv_xlen == 32)
  return "riscv32";
#elif defined(__mips__) && defined(__mips64)
  return "mips64";
#elif defined(__mips__)
  return "mips";
#elif defined(__powerpc64__) || defined(__ppc64__)
  return "ppc64";
#elif defined(__powerpc__) || defined(__ppc__)
  return "ppc";
#elif defined(__s390x__)
  return "s390x";
#elif defined(__s390__)
  return "s390";
#else
  return "unknown";
#endif
}

std::string compiled_version() {
#if defined(_WIN32) && defined(_WIN32_WINNT)
  char buffer[16] = {};
  std::snprintf(buffer, sizeof(buffer), "%d.%d", (_WIN32_WINNT >> 8) & 0xff, _WIN32_WINNT & 0xff);
  return buffer;
#else
  return "unknown";
#endif
}

std::string native_path_separator() {
#ifdef _WIN32
  return ";";
#else
  return ":";
#endif
}

snapshot compiled_snapshot() {
  return make_snapshot(
      compiled_operating_system(), compiled_architecture(), compiled_version(), native_path_separator()
  );
}

#ifdef _WIN32

using rtl_get_version_fn = LONG(WINAPI*)(OSVERSIONINFOW*);

// RtlGetVersion reports the real version; GetVersionEx is capped by the application manifest
std::optional<OSVERSIONINFOW> query_windows_version() {
  OSVERSIONINFOW info{};
  info.dwOSVersionInfoSize = sizeof(info);

  if (HMODULE ntdll = GetModuleHandleW(L"ntdll.dll")) {
    auto rtl_get_version = reinterpret_cast<rtl_get_version_fn>(GetProcAddress(ntdll, "RtlGetVersion"));
    if (rtl_get_version != nullptr && rtl_get_version(&info) == 0) {
      return info;
    }
  }

#ifdef _MSC_VER
#pragma warning(suppress : 4996)
#endif
  if (GetVersionExW(&info)) {
    return info;
  }
  return std::nullopt;
}

std::string windows_architecture() {
  SYSTEM_INFO system{};
  GetNativeSystemInfo(&system);

  switch (system.wProcessorArchitecture) {
  case PROCESSOR_ARCHITECTURE_AMD64:
    return "amd64";
  case PROCESSOR_ARCHITECTURE_INTEL:
    return "x86";
  case PROCESSOR_ARCHITECTURE_ARM:
    return "arm";
  case PROCESSOR_ARCHITECTURE_IA64:
    return "ia64";
#ifdef PROCESSOR_ARCHITECTURE_ARM64
  case PROCESSOR_ARCHITECTURE_ARM64:
    return "aarch64";
#endif
  default:
    return compiled_architecture();
  }
}

std::optional<snapshot> query_windows_host() {
  auto version = query_windows_version();
  if (!version) {
    return std::nullopt;
  }

  char number[32] = {};
  std::snprintf(
      number, sizeof(number), "%lu.%lu", static_cast<unsigned long>(version->dwMajorVersion),
      static_cast<unsigned long>(version->dwMinorVersion)
  );

  return make_snapshot(
      windows_release_name(
          version->dwMajorVersion, version->dwMinorVersion, version->dwBuildNumber,
          version->dwPlatformId == VER_PLATFORM_WIN32_NT
      ),
      windows_architecture(), number, native_path_separator()
  );
}

#endif

} // namespace

std::string windows_release_name(unsigned major, unsigned minor, unsigned build, bool nt_kernel) {
  if (!nt_kernel) {
    if (major == 4 && minor == 0) {
      return "windows 95";
    }
    if (major == 4 && minor == 10) {
      return "windows 98";
    }
    if (major == 4 && minor == 90) {
      return "windows me";
    }
    return "windows";
  }

  if (major == 10) {
    // windows 11 kept the 10.0 version number
    return build >= 22000 ? "windows 11" : "windows 10";
  }
  if (major == 6) {
    switch (minor) {
    case 0:
      return "windows vista";
    case 1:
      return "windows 7";
    case 2:
      return "windows 8";
    case 3:
      return "windows 8.1";
    default:
      break;
    }
  }
  if (major == 5) {
    switch (minor) {
    case 0:
      return "windows 2000";
    case 1:
      return "windows xp";
    case 2:
      return "windows 2003";
    default:
      break;
    }
  }
  return "windows nt";
}

snapshot make_snapshot(
    std::string_view name, std::string_view arch, std::string_view version, std::string_view path_separator
) {
  snapshot result;
  result.name = util::to_lower(name);
  result.arch = util::to_lower(arch);
  result.version = util::to_lower(version);
  result.path_separator = std::string(path_separator);
  return result;
}

snapshot detect_snapshot() {
  auto log = redlog::get_logger("h0st.snapshot");

#ifdef _WIN32
  auto queried = query_windows_host();
  if (!queried) {
    log.wrn("windows version query failed, using compile-time platform values");
    return compiled_snapshot();
  }
  snapshot detected = *queried;
#else
  struct utsname info {};
  if (uname(&info) != 0) {
    log.wrn("uname failed, using compile-time platform values");
    return compiled_snapshot();
  }
  snapshot detected = make_snapshot(info.sysname, info.machine, info.release, native_path_separator());
#endif

  if (detected.name.empty() || detected.name == "unknown") {
    log.wrn("unknown operating system detected - consider adding support");
  }
  if (detected.arch.empty() || detected.arch == "unknown") {
    log.wrn("unknown architecture detected - consider adding support");
  }

  log.dbg(
      "detected host", redlog::field("name", detected.name), redlog::field("arch", detected.arch),
      redlog::field("version", detected.version), redlog::field("path_separator", detected.path_separator)
  );
  return detected;
}

snapshot apply_overrides(snapshot base, const host_config& config) {
  if (!config.has_overrides()) {
    return base;
  }

  auto log = redlog::get_logger("h0st.snapshot");
  snapshot result = make_snapshot(
      config.os_name.value_or(base.name), config.os_arch.value_or(base.arch),
      config.os_version.value_or(base.version), config.path_separator.value_or(base.path_separator)
  );

  log.vrb(
      "applied host overrides", redlog::field("name", result.name), redlog::field("arch", result.arch),
      redlog::field("version", result.version), redlog::field("path_separator", result.path_separator)
  );
  return result;
}

snapshot load_snapshot() {
  host_config config = host_config::from_environment();
  apply_configured_verbosity(config);
  return apply_overrides(detect_snapshot(), config);
}

const snapshot& current_snapshot() {
  static const snapshot instance = load_snapshot();
  return instance;
}

} // namespace h0st
