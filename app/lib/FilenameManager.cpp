#include "FilenameManager.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "UniqueNameResolver.hpp"
#include "Utils.hpp"

#include <fmt/format.h>


FilenameManager::FilenameManager(NamingOptions options)
    : options_(options)
{
    if (options_.max_base_len < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        fmt::format("NamingOptions.max_base_len={}", options_.max_base_len));
    }
}


std::string FilenameManager::get_sanitized_filename(const std::string& original_title,
                                                    const std::string& extension)
{
    return get_sanitized_filename(original_title, extension, options_.max_base_len);
}


std::string FilenameManager::get_sanitized_filename(const std::string& original_title,
                                                    const std::string& extension,
                                                    int max_base_len)
{
    std::string sanitized = UniqueNameResolver::resolve_unique(
        original_title, extension, issued_names_, max_base_len, options_.use_spaces);

    issued_names_.insert(Utils::to_lower_copy(sanitized));
    filename_mappings_[original_title + extension] = sanitized;

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Issued '{}' for title '{}' ({} name(s) in session)",
                      sanitized, original_title, issued_names_.size());
    }
    return sanitized;
}


std::string FilenameManager::get_mapping(const std::string& original_filename) const
{
    if (auto it = filename_mappings_.find(original_filename); it != filename_mappings_.end()) {
        return it->second;
    }
    return original_filename;
}


bool FilenameManager::is_issued(const std::string& filename) const
{
    return issued_names_.contains(Utils::to_lower_copy(filename));
}
