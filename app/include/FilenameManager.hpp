#ifndef FILENAME_MANAGER_HPP
#define FILENAME_MANAGER_HPP

#include "Types.hpp"

#include <cstddef>
#include <map>
#include <string>

/**
 * @brief Hands out unique filenames for one export run.
 *
 * Owns the set of issued (case-folded) names and the title -> filename map.
 * Both only grow. Not thread-safe; use one instance per sequential export job.
 */
class FilenameManager {
public:
    explicit FilenameManager(NamingOptions options = {});

    std::string get_sanitized_filename(const std::string& original_title,
                                       const std::string& extension);
    std::string get_sanitized_filename(const std::string& original_title,
                                       const std::string& extension,
                                       int max_base_len);

    // Filename recorded for title + extension, or the argument itself when unknown.
    std::string get_mapping(const std::string& original_filename) const;

    bool is_issued(const std::string& filename) const;
    std::size_t issued_count() const { return issued_names_.size(); }
    const std::map<std::string, std::string>& mappings() const { return filename_mappings_; }
    const NamingOptions& options() const { return options_; }
    bool use_spaces() const { return options_.use_spaces; }

private:
    NamingOptions options_;
    IssuedNameSet issued_names_;
    std::map<std::string, std::string> filename_mappings_;
};

#endif
