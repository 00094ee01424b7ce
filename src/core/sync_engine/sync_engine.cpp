#include "sync_engine.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/interrupt.hpp"
#include "../../infra/retry.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"
#include "../accounting/metrics.hpp"

namespace xferacct::core {

namespace {

// EBUSY/ETXTBSY/EAGAIN при открытии повторяем, остальное сразу ошибка
auto open_error_code(int err, infra::ErrorCode fallback) -> infra::ErrorCode {
    switch (err) {
        case EBUSY:
        case ETXTBSY:
        case EAGAIN:
            return infra::ErrorCode::ResourceBusy;
        case ENOENT:
            return infra::ErrorCode::FileNotFound;
        default:
            return fallback;
    }
}

void copy_metadata(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, time, ec);
    }
    if (!ec) {
        auto perms = std::filesystem::status(src, ec).permissions();
        if (!ec) {
            std::filesystem::permissions(dst, perms, ec);
        }
    }
    if (ec) {
        spdlog::warn("Failed to copy metadata for {}: {}", dst.string(), ec.message());
    }
}

} // namespace

SyncEngine::SyncEngine(const infra::Config& config, accounting::StatsAggregator& stats)
    : config_(config), stats_(stats), errors_(stats) {}

auto SyncEngine::run(const std::filesystem::path& source,
                     const std::filesystem::path& destination)
    -> std::expected<SyncSummary, infra::Error>
{
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                             fmt::format("Source is not a directory: {}", source.string())));
    }
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot create destination: {}", ec.message())));
    }

    auto scanned = scan(source);
    if (!scanned) {
        return std::unexpected(std::move(scanned.error()));
    }
    const auto& files = *scanned;

    std::unordered_set<std::string> keep;
    {
        std::lock_guard lock(backlog_mutex_);
        checks_left_ = Backlog{};
        transfers_left_ = Backlog{};
        for (const auto& file : files) {
            ++checks_left_.count;
            checks_left_.bytes += file.size;
            keep.insert(file.relative.generic_string());
        }
        stats_.set_check_queue(checks_left_.count, checks_left_.bytes);
        stats_.set_transfer_queue(0, 0);
    }
    spdlog::debug("Found {} files in {}", files.size(), source.string());

    {
        // transfers разрушается первым: к этому моменту проверки уже не ставят задачи
        infra::ThreadPool checkers{config_.checkers_or_default()};
        infra::ThreadPool transfers{config_.transfers_or_default()};

        for (const auto& file : files) {
            checkers.submit([&, file]() {
                if (infra::is_interrupted()) {
                    return;
                }
                const auto id = file.relative.generic_string();
                const auto src = source / file.relative;
                const auto dst = destination / file.relative;

                stats_.start_check(id);
                const bool changed = needs_transfer(src, dst, file.size);
                stats_.finish_check(id);
                check_done(file.size);

                if (!changed) {
                    spdlog::debug("Unchanged: {}", id);
                    return;
                }
                transfer_queued(file.size);
                transfers.submit([this, id, src, dst, size = file.size]() {
                    transfer(id, src, dst, size);
                });
            });
        }

        checkers.wait();
        transfers.wait();
    }

    if (infra::is_interrupted()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "User interrupted"));
    }

    if (config_.delete_extra) {
        if (stats_.has_errored()) {
            spdlog::warn("Not deleting files as there were errors");
        } else {
            delete_extra(destination, keep);
        }
    }

    return SyncSummary{
        .checked = stats_.get_checks(),
        .transferred = stats_.get_transfers(),
        .deleted = stats_.get_deletes(),
        .bytes = stats_.get_bytes(),
        .errors = stats_.get_errors()
    };
}

auto SyncEngine::scan(const std::filesystem::path& root) -> infra::Result<std::vector<SourceFile>> {
    std::vector<SourceFile> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                             fmt::format("Cannot list {}: {}", root.string(), ec.message())));
    }

    for (const std::filesystem::recursive_directory_iterator end{}; it != end; ) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (entry_ec) {
                errors_.record_error(infra::log_and_return(infra::make_error(infra::ErrorCode::ReadFailed,
                    fmt::format("Failed to get size for {}: {}", it->path().string(), entry_ec.message()))));
            } else {
                files.push_back(SourceFile{.relative = it->path().lexically_relative(root), .size = size});
            }
        }

        it.increment(ec);
        if (ec) {
            errors_.record_error(infra::log_and_return(infra::make_error(infra::ErrorCode::ReadFailed,
                fmt::format("Listing {} stopped early: {}", root.string(), ec.message()))));
            break;
        }
    }

    std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
        return a.relative < b.relative;
    });
    return files;
}

auto SyncEngine::needs_transfer(const std::filesystem::path& src,
                                const std::filesystem::path& dst,
                                std::uintmax_t size) const -> bool
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dst, ec)) {
        return true;
    }
    auto dst_size = std::filesystem::file_size(dst, ec);
    if (ec || dst_size != size) {
        return true;
    }
    auto src_time = std::filesystem::last_write_time(src, ec);
    if (ec) return true;
    auto dst_time = std::filesystem::last_write_time(dst, ec);
    if (ec) return true;
    return src_time != dst_time;
}

void SyncEngine::transfer(const std::string& id, const std::filesystem::path& src,
                          const std::filesystem::path& dst, std::uintmax_t size)
{
    if (infra::is_interrupted()) {
        transfer_done(size);
        return;
    }

    stats_.start_transfer(id);
    stats_.progress().begin(id, size);

    const infra::RetryPolicy policy{.max_attempts = config_.retries_or_default()};
    auto res = infra::with_retry(
        [&]() -> infra::VoidResult {
            try {
                return copy_contents(id, src, dst, size);
            } catch (const std::exception& e) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                     fmt::format("Copying {} failed: {}", id, e.what())));
            }
        },
        policy,
        [&](int attempt, const infra::Error& err) {
            spdlog::debug("Retrying {} after attempt {}: {}", id, attempt, err.message);
        });

    const auto item = stats_.progress().get(id);
    stats_.progress().end(id);
    stats_.finish_transfer(id, res.has_value());
    if (res) {
        if (item) {
            spdlog::debug("Copied {} ({} bytes, {})", id, item->bytes,
                          accounting::format_size(std::floor(item->speed), "Bytes/s"));
        } else {
            spdlog::debug("Copied {} ({} bytes)", id, size);
        }
    } else {
        errors_.record_error(infra::log_and_return(std::move(res.error())));
    }
    transfer_done(size);
}

auto SyncEngine::copy_contents(const std::string& id, const std::filesystem::path& src,
                               const std::filesystem::path& dst, std::uintmax_t size)
    -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::create_directories(dst.parent_path(), ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                             fmt::format("Cannot create {}: {}", dst.parent_path().string(), ec.message())));
    }

    errno = 0;
    std::ifstream ifs(src, std::ios::binary);
    if (!ifs) {
        return std::unexpected(infra::make_error(open_error_code(errno, infra::ErrorCode::ReadFailed),
                             fmt::format("Cannot open {}", src.string())));
    }
    errno = 0;
    std::ofstream ofs(dst, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(infra::make_error(open_error_code(errno, infra::ErrorCode::WriteFailed),
                             fmt::format("Cannot create {}", dst.string())));
    }

    std::vector<char> buffer(config_.buffer_size_or_default());
    std::uint64_t copied = 0;
    while (ifs) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                 fmt::format("Interrupted while copying {}", id)));
        }
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = static_cast<std::uint64_t>(ifs.gcount());
        if (n == 0) break;
        if (!ofs.write(buffer.data(), static_cast<std::streamsize>(n))) {
            return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                                 fmt::format("Write error in {} at offset {}", dst.string(), copied)));
        }
        copied += n;
        stats_.add_bytes(n);
        stats_.progress().advance(id, n);
    }
    if (ifs.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                             fmt::format("Read error in {} at offset {}", src.string(), copied)));
    }
    ofs.close();
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                             fmt::format("Failed to flush {}", dst.string())));
    }
    if (copied != size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch,
                             fmt::format("{}: expected {} bytes, copied {}", id, size, copied)));
    }

    copy_metadata(src, dst);
    return {};
}

void SyncEngine::delete_extra(const std::filesystem::path& destination,
                              const std::unordered_set<std::string>& keep)
{
    std::vector<std::filesystem::path> extra;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        destination, std::filesystem::directory_options::skip_permission_denied, ec);
    for (const std::filesystem::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        auto relative = it->path().lexically_relative(destination).generic_string();
        if (!keep.contains(relative)) {
            extra.push_back(it->path());
        }
    }
    if (ec) {
        errors_.record_error(infra::log_and_return(infra::make_error(infra::ErrorCode::ReadFailed,
            fmt::format("Cannot list {}: {}", destination.string(), ec.message()))));
        return;
    }

    for (const auto& path : extra) {
        std::error_code rm_ec;
        std::filesystem::remove(path, rm_ec);
        if (rm_ec) {
            errors_.record_error(infra::log_and_return(infra::make_error(infra::ErrorCode::DeleteFailed,
                fmt::format("Cannot delete {}: {}", path.string(), rm_ec.message()))));
            continue;
        }
        const auto n = stats_.add_deletes(1);
        spdlog::info("Deleted {} (#{})", path.lexically_relative(destination).generic_string(), n);
    }
}

void SyncEngine::check_done(std::uint64_t size) {
    std::lock_guard lock(backlog_mutex_);
    checks_left_.count -= std::min<std::uint64_t>(checks_left_.count, 1);
    checks_left_.bytes -= std::min<std::uint64_t>(checks_left_.bytes, size);
    stats_.set_check_queue(checks_left_.count, checks_left_.bytes);
}

void SyncEngine::transfer_queued(std::uint64_t size) {
    std::lock_guard lock(backlog_mutex_);
    ++transfers_left_.count;
    transfers_left_.bytes += size;
    stats_.set_transfer_queue(transfers_left_.count, transfers_left_.bytes);
}

void SyncEngine::transfer_done(std::uint64_t size) {
    std::lock_guard lock(backlog_mutex_);
    transfers_left_.count -= std::min<std::uint64_t>(transfers_left_.count, 1);
    transfers_left_.bytes -= std::min<std::uint64_t>(transfers_left_.bytes, size);
    stats_.set_transfer_queue(transfers_left_.count, transfers_left_.bytes);
}

} // namespace xferacct::core
