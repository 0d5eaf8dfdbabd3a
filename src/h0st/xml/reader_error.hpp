#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace h0st::xml {

/**
 * @brief Thrown by xml readers when no character encoding can be determined
 *
 * Carries every piece of encoding evidence gathered before giving up (byte order mark,
 * content sniffing, the xml prolog and the content-type header) together with the part of the
 * input that was not consumed. The input is forward-only: bytes read during detection are gone,
 * so a caller retrying with a fallback encoding must start from remaining_input().
 */
class reader_error : public std::runtime_error {
public:
  reader_error(
      const std::string& message, std::optional<std::string> bom_encoding,
      std::optional<std::string> xml_guess_encoding, std::optional<std::string> xml_encoding,
      std::shared_ptr<std::istream> remaining_input
  );

  reader_error(
      const std::string& message, std::optional<std::string> content_type_mime,
      std::optional<std::string> content_type_encoding, std::optional<std::string> bom_encoding,
      std::optional<std::string> xml_guess_encoding, std::optional<std::string> xml_encoding,
      std::shared_ptr<std::istream> remaining_input
  );

  const std::optional<std::string>& bom_encoding() const noexcept { return bom_encoding_; }
  const std::optional<std::string>& xml_guess_encoding() const noexcept { return xml_guess_encoding_; }
  const std::optional<std::string>& xml_encoding() const noexcept { return xml_encoding_; }
  const std::optional<std::string>& content_type_mime() const noexcept { return content_type_mime_; }
  const std::optional<std::string>& content_type_encoding() const noexcept { return content_type_encoding_; }

  // unconsumed remainder of the input, may be null
  const std::shared_ptr<std::istream>& remaining_input() const noexcept { return remaining_input_; }

private:
  std::optional<std::string> bom_encoding_;
  std::optional<std::string> xml_guess_encoding_;
  std::optional<std::string> xml_encoding_;
  std::optional<std::string> content_type_mime_;
  std::optional<std::string> content_type_encoding_;
  std::shared_ptr<std::istream> remaining_input_;
};

} // namespace h0st::xml
