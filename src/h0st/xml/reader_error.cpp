#include "reader_error.hpp"

#include <utility>

namespace h0st::xml {

reader_error::reader_error(
    const std::string& message, std::optional<std::string> bom_encoding, std::optional<std::string> xml_guess_encoding,
    std::optional<std::string> xml_encoding, std::shared_ptr<std::istream> remaining_input
)
    : reader_error(
          message, std::nullopt, std::nullopt, std::move(bom_encoding), std::move(xml_guess_encoding),
          std::move(xml_encoding), std::move(remaining_input)
      ) {}

reader_error::reader_error(
    const std::string& message, std::optional<std::string> content_type_mime,
    std::optional<std::string> content_type_encoding, std::optional<std::string> bom_encoding,
    std::optional<std::string> xml_guess_encoding, std::optional<std::string> xml_encoding,
    std::shared_ptr<std::istream> remaining_input
)
    : std::runtime_error(message), bom_encoding_(std::move(bom_encoding)),
      xml_guess_encoding_(std::move(xml_guess_encoding)), xml_encoding_(std::move(xml_encoding)),
      content_type_mime_(std::move(content_type_mime)), content_type_encoding_(std::move(content_type_encoding)),
      remaining_input_(std::move(remaining_input)) {}

} // namespace h0st::xml
