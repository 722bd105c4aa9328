#include "report/report_writer.hpp"

#include <gradebox/common/linux.hpp>
#include <gradebox/exceptions.hpp>
#include <gradebox/logging.hpp>

#include "report/report_json.hpp"

#include <fmt/format.h>
#include <gsl/util>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace gradebox {

namespace fs = std::filesystem;

ReportWriter::ReportWriter(fs::path destination)
    : destination_{std::move(destination)} {}

void ReportWriter::write(const Report& report) const {
    write_atomically(destination_, serialize_report(report));

    LOG_INFO("Wrote report to {:?} (status {}, score {:.4f})", destination_.string(), report.status, report.score);
}

void ReportWriter::write_atomically(const fs::path& destination, std::string_view contents) {
    auto fail = [&destination](std::string_view step, const std::error_code& err) {
        return ResultPersistenceError(
            fmt::format("Could not write results to {:?}: {} failed ({})", destination.string(), step, err.message()));
    };

    fs::path directory = destination.parent_path();
    if (directory.empty()) {
        directory = ".";
    }

    std::error_code err;
    fs::create_directories(directory, err);
    if (err) {
        throw fail("creating the result directory", err);
    }

    fs::path temp_path = directory / fmt::format(".{}.tmp-{}", destination.filename().string(), ::getpid());

    auto fd = linux::open(temp_path.string(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (!fd) {
        throw fail("open", fd.error());
    }

    bool renamed = false;
    auto cleanup = gsl::finally([&] {
        if (!renamed) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
        }
    });

    {
        auto close_fd = gsl::finally([fd = fd.value()] { std::ignore = linux::close(fd); });

        if (auto res = linux::write_all(fd.value(), contents); !res) {
            throw fail("write", res.error());
        }

        if (auto res = linux::fsync(fd.value()); !res) {
            throw fail("fsync", res.error());
        }
    }

    if (auto res = linux::rename(temp_path.string(), destination.string()); !res) {
        throw fail("rename", res.error());
    }
    renamed = true;

    // The rename itself is only durable once the directory entry is
    auto dir_fd = linux::open(directory.string(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (!dir_fd) {
        throw fail("opening the result directory", dir_fd.error());
    }

    auto close_dir = gsl::finally([dir_fd = dir_fd.value()] { std::ignore = linux::close(dir_fd); });

    if (auto res = linux::fsync(dir_fd.value()); !res) {
        throw fail("fsync of the result directory", res.error());
    }
}

} // namespace gradebox
