#include "TableReader.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "LottoLensExceptions.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr size_t kDelimiterSampleLines = 10;

std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnToFile(const std::string& executable,
                const std::vector<std::string>& args,
                const std::string& outputPath) {
    const int outFd = ::open(outputPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (outFd < 0) return -1;

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outFd);
        return -1;
    }

    if (pid == 0) {
        const int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDERR_FILENO);
            ::close(devNull);
        }

        if (::dup2(outFd, STDOUT_FILENO) < 0) {
            _exit(127);
        }
        ::close(outFd);

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        ::execv(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(outFd);
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

struct ConverterCommand {
    const char* executable;
    std::vector<std::string> leadingArgs;
};

// Returns false when the path is read directly.
bool converterFor(const std::string& lowerExt, ConverterCommand& out) {
    if (lowerExt == ".xlsx") {
        out = {"xlsx2csv", {"--sheet", "1", "--dateformat", "%d/%m/%Y"}};
        return true;
    }
    if (lowerExt == ".xls") {
        out = {"xls2csv", {}};
        return true;
    }
    if (lowerExt == ".gz") {
        out = {"gzip", {"-cd"}};
        return true;
    }
    if (lowerExt == ".zip") {
        out = {"unzip", {"-p"}};
        return true;
    }
    return false;
}

Cell typeCell(const std::string& raw, bool nativeNumbers) {
    std::string text = CommonUtils::trim(raw);
    if (text.empty()) return Cell{};
    if (!nativeNumbers && text.find_first_of("/-.") != std::string::npos) {
        return Cell{std::move(text)};
    }
    const Cell asText{text};
    if (auto number = cellToNumber(asText)) return Cell{*number};
    return asText;
}
} // namespace

ContainerKind TableReader::inferKind(const std::string& path) {
    const std::string lowerExt = CommonUtils::toLower(std::filesystem::path(path).extension().string());
    if (lowerExt == ".xlsx" || lowerExt == ".xls") return ContainerKind::SPREADSHEET;
    return ContainerKind::DELIMITED_TEXT;
}

RawGrid TableReader::parseDelimited(std::istream& in,
                                    const std::string& sourceName,
                                    char delimiter,
                                    bool nativeNumbers) {
    CSVUtils::skipBOM(in);
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw LottoLens::MalformedFileError(sourceName, "read failure");
    }
    if (content.find('\0') != std::string::npos) {
        throw LottoLens::MalformedFileError(sourceName, "binary content where delimited text was expected");
    }

    if (delimiter == 0) {
        // Title rows above the header carry no delimiter, so sample several lines.
        std::istringstream probe(content);
        std::string line;
        std::string sample;
        size_t sampled = 0;
        while (sampled < kDelimiterSampleLines && std::getline(probe, line)) {
            if (CommonUtils::trim(line).empty()) continue;
            sample += line + "\n";
            ++sampled;
        }
        delimiter = CSVUtils::detectDelimiter(sample);
    }

    std::istringstream stream(content);
    RawGrid grid;
    size_t record = 0;
    while (stream.peek() != EOF) {
        ++record;
        bool malformed = false;
        bool limitExceeded = false;
        auto fields = CSVUtils::parseCSVLine(stream, delimiter, &malformed, &limitExceeded);
        if (limitExceeded) {
            throw LottoLens::MalformedFileError(sourceName, "record " + std::to_string(record) + " exceeds parser limits");
        }
        if (malformed) {
            throw LottoLens::MalformedFileError(sourceName, "unterminated quoted field in record " + std::to_string(record));
        }
        if (fields.empty()) continue;

        RawRow row;
        row.reserve(fields.size());
        for (const auto& field : fields) {
            row.push_back(typeCell(field, nativeNumbers));
        }
        grid.push_back(std::move(row));
    }
    return grid;
}

RawGrid TableReader::readFile(const std::string& path, const TableReadOptions& options) {
    namespace fs = std::filesystem;
    const std::string displayName = fs::path(path).filename().string();
    const std::string lowerExt = CommonUtils::toLower(fs::path(path).extension().string());

    std::error_code existsEc;
    if (!fs::exists(path, existsEc) || existsEc) {
        throw LottoLens::MalformedFileError(displayName, "file does not exist");
    }

    const ContainerKind kind = options.kind == ContainerKind::AUTO ? inferKind(path) : options.kind;
    const bool nativeNumbers = (kind == ContainerKind::SPREADSHEET);

    std::string readPath = path;
    struct TempFileGuard {
        std::string path;
        bool enabled = false;
        ~TempFileGuard() {
            if (!enabled) return;
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    } tempGuard;

    ConverterCommand converter;
    if (converterFor(lowerExt, converter)) {
        const std::string exe = findExecutableInPath(converter.executable);
        if (exe.empty()) {
            throw LottoLens::MalformedFileError(displayName, std::string(converter.executable) + " is required to read " + lowerExt + " files");
        }

        // The same path may be converted by several workers of one batch.
        static std::atomic<unsigned long long> conversionCounter{0};
        const std::string stamp = std::to_string(static_cast<unsigned long long>(
            std::hash<std::string>{}(path + std::to_string(std::time(nullptr)) + std::to_string(::getpid())))) +
            "_" + std::to_string(conversionCounter.fetch_add(1));
        tempGuard.path = (fs::temp_directory_path() / ("lottolens_input_" + stamp + ".csv")).string();
        tempGuard.enabled = true;

        std::vector<std::string> args = converter.leadingArgs;
        args.push_back(path);
        const int rc = spawnToFile(exe, args, tempGuard.path);
        if (rc != 0) {
            throw LottoLens::MalformedFileError(displayName, std::string(converter.executable) + " failed with status " + std::to_string(rc));
        }
        readPath = tempGuard.path;
    }

    std::ifstream in(readPath, std::ios::binary);
    if (!in) throw LottoLens::MalformedFileError(displayName, "could not open file");

    // Converted spreadsheets are always comma separated.
    const char delimiter = nativeNumbers && lowerExt != ".csv" ? ',' : options.delimiter;
    return parseDelimited(in, displayName, delimiter, nativeNumbers);
}
