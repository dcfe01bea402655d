#pragma once

#include <string>

namespace courtsched::core::util {

class AtomicFileWriter {
public:
    // Writes `contents` to `path + ".tmp"` and renames it over `path`, so
    // readers see either the old file or the complete new one.
    static bool Write(const std::string& path, const std::string& contents);

    static bool EnsureParentDir(const std::string& path);
};

}  // namespace courtsched::core::util
