#include "report/RunLog.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace csvcheck {

static std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json run_log_record(const ValidationResult& res, const ValidationOptions& opts) {
    nlohmann::json j;
    j["ts"] = utc_timestamp();
    j["file_path"] = res.file_path;
    j["encoding"] = opts.encoding;
    j["delimiter"] = std::string(1, opts.delimiter);
    j["max_errors"] = opts.max_errors ? nlohmann::json(*opts.max_errors) : nlohmann::json(nullptr);
    j["valid"] = res.valid;
    j["total_rows"] = res.total_rows;
    j["rows_validated"] = res.rows_validated;
    j["error_count"] = res.error_count;
    return j;
}

bool append_run_log(const fs::path& path, const ValidationResult& res, const ValidationOptions& opts) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out) return false;
    out << run_log_record(res, opts).dump() << "\n";
    return static_cast<bool>(out);
}

}  // namespace csvcheck
