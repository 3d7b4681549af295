#include "insar_rate/core/utils.hpp"
#include "insar_rate/core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <regex>
#include <cstring>
#include <sstream>

#include <openssl/evp.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace insar_rate::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

static bool parse_iso_date(const std::string& date, std::tm& out) {
    std::tm tm_buf{};
    std::istringstream iss(date);
    iss >> std::get_time(&tm_buf, "%Y-%m-%d");
    if (iss.fail()) {
        return false;
    }
    // Reject trailing characters such as a time of day
    iss >> std::ws;
    if (!iss.eof()) {
        return false;
    }
    out = tm_buf;
    return true;
}

bool is_iso_date(const std::string& date) {
    std::tm tm_buf{};
    return parse_iso_date(date, tm_buf);
}

long days_since_epoch(const std::string& date) {
    std::tm tm_buf{};
    if (!parse_iso_date(date, tm_buf)) {
        throw ValidationError("Invalid epoch date (expected YYYY-MM-DD): '" + date + "'");
    }
    tm_buf.tm_hour = 12;
    const std::time_t t = timegm(&tm_buf);
    return static_cast<long>(std::floor(static_cast<double>(t) / 86400.0));
}

double years_between(const std::string& first, const std::string& second) {
    return static_cast<double>(days_since_epoch(second) - days_since_epoch(first)) /
           kDaysPerYear;
}

std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern) {
    std::vector<fs::path> files;

    if (!fs::exists(input_dir) || !fs::is_directory(input_dir)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file()) {
            std::string filename = entry.path().filename().string();
            if (glob_match(pattern, filename)) {
                files.push_back(entry.path());
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> read_path_list(const fs::path& list_file) {
    std::ifstream file(list_file);
    if (!file) {
        throw IOError("Cannot open interferogram list: " + list_file.string());
    }

    const fs::path base = list_file.parent_path();
    std::vector<fs::path> paths;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        fs::path p(line);
        if (p.is_relative()) {
            p = base / p;
        }
        paths.push_back(p);
    }
    return paths;
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string file_stem(const fs::path& path) {
    const std::string name = path.filename().string();
    const auto dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

namespace {

std::string errno_message() {
    return std::strerror(errno);
}

void fsync_path(const fs::path& target, int flags) {
    int fd = ::open(target.c_str(), flags);
    if (fd < 0) {
        throw IOError("Cannot open " + target.string() + " for sync: " + errno_message());
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw IOError("Cannot sync " + target.string() + ": " + errno_message());
    }
}

fs::path temp_path_for(const fs::path& path) {
    fs::path tmp = path;
    tmp += ".tmp";
    return tmp;
}

} // namespace

void write_atomically(const fs::path& path, const char* data, size_t size) {
    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path());
    }
    const fs::path tmp = temp_path_for(path);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw IOError("Cannot create " + tmp.string() + ": " + errno_message());
    }

    size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::string msg = errno_message();
            ::close(fd);
            throw IOError("Cannot write " + tmp.string() + ": " + msg);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        const std::string msg = errno_message();
        ::close(fd);
        throw IOError("Cannot sync " + tmp.string() + ": " + msg);
    }
    if (::close(fd) != 0) {
        throw IOError("Cannot close " + tmp.string() + ": " + errno_message());
    }
    commit_file(tmp, path);
}

void write_atomically(const fs::path& path, const std::string& payload) {
    write_atomically(path, payload.data(), payload.size());
}

void commit_file(const fs::path& tmp, const fs::path& path) {
    fsync_path(tmp, O_RDONLY);

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw IOError("Cannot move " + tmp.string() + " to " + path.string() + ": " +
                      ec.message());
    }

    const fs::path dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    fsync_path(dir, O_RDONLY | O_DIRECTORY);
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw InsarRateError("Cannot allocate SHA-256 context");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw InsarRateError("SHA-256 computation failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    auto data = read_bytes(path);
    return sha256_bytes(data);
}

double nan_median(std::vector<double> values) {
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double v) { return std::isnan(v); }),
                 values.end());
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const size_t n = values.size();
    const size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double hi = values[mid];
    if ((n % 2) == 1) return hi;
    const double lo = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lo + hi);
}

double nan_mean(const std::vector<double>& values) {
    double sum = 0.0;
    size_t n = 0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        sum += v;
        ++n;
    }
    return n > 0 ? sum / static_cast<double>(n) : std::numeric_limits<double>::quiet_NaN();
}

double nan_std(const std::vector<double>& values) {
    const double mean = nan_mean(values);
    if (std::isnan(mean)) {
        return mean;
    }
    double var = 0.0;
    size_t n = 0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        const double d = v - mean;
        var += d * d;
        ++n;
    }
    return std::sqrt(var / static_cast<double>(n));
}

size_t count_finite(const Matrix2Df& data) {
    size_t n = 0;
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        if (std::isfinite(data.data()[i])) ++n;
    }
    return n;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string format_double(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': regex_pattern += "\\."; break;
            case '[': regex_pattern += "["; break;
            case ']': regex_pattern += "]"; break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

} // namespace insar_rate::core
