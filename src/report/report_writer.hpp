#pragma once

#include <gradebox/model/report.hpp>

#include <filesystem>
#include <string_view>

namespace gradebox {

/// Persists the Report to its single well-known location. The file is replaced atomically: readers see
/// either the previous contents or the complete new document, never a partial write.
class ReportWriter
{
public:
    explicit ReportWriter(std::filesystem::path destination);

    /// Throws ResultPersistenceError on any failure
    void write(const Report& report) const;

    /// Temp file in the destination's directory, write + fsync, rename over the destination, fsync the
    /// directory. Throws ResultPersistenceError
    static void write_atomically(const std::filesystem::path& destination, std::string_view contents);

    const std::filesystem::path& get_destination() const { return destination_; }

private:
    std::filesystem::path destination_;
};

} // namespace gradebox
