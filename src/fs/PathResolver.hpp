#pragma once
#include <string>

namespace PathResolver {
    // Join a possibly-relative path onto cwd and normalize it ('.', '..',
    // repeated and trailing separators). Pure path algebra; never touches
    // the filesystem and never fails.
    std::string resolve(const std::string& path, const std::string& cwd);

    // Last component of an already resolved path ("/" for the root).
    std::string basename(const std::string& path);
}
