#include "exception.h"

#include <fmt/format.h>

#include <filesystem>

namespace {
std::string short_file_name(const char *path) {
    return std::filesystem::path{path}.filename().string();
}
} // namespace

namespace drisk::core {

DemoRiskException::DemoRiskException(const std::string &message, const source_location &location)
    : std::runtime_error{fmt::format("{}:{}: {}", short_file_name(location.file_name()),
                                     location.line(), message)},
      message_{message}, file_name_{short_file_name(location.file_name())},
      line_{location.line()} {}

const std::string &DemoRiskException::message() const noexcept { return message_; }

const std::string &DemoRiskException::file_name() const noexcept { return file_name_; }

std::uint_least32_t DemoRiskException::line() const noexcept { return line_; }

} // namespace drisk::core
