#ifndef LOTTOLENS_EXCEPTIONS_H
#define LOTTOLENS_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace LottoLens {

class LottoLensException : public std::runtime_error {
public:
    explicit LottoLensException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public LottoLensException {
public:
    explicit IOException(const std::string& message) : LottoLensException("IO Error: " + message) {}
};

class ConfigurationException : public LottoLensException {
public:
    explicit ConfigurationException(const std::string& message) : LottoLensException("Configuration Error: " + message) {}
};

// File-level: the bytes of one file could not be turned into a grid.
class MalformedFileError : public LottoLensException {
public:
    MalformedFileError(const std::string& fileName, const std::string& detail)
        : LottoLensException("Malformed file '" + fileName + "': " + detail), fileName_(fileName) {}

    const std::string& fileName() const noexcept { return fileName_; }

private:
    std::string fileName_;
};

// File-level: no row in the scanned window carries a usable column layout.
class HeaderNotFoundError : public LottoLensException {
public:
    explicit HeaderNotFoundError(const std::string& message) : LottoLensException("Header not found: " + message) {}
};

// Wraps a file-level failure with the file it came from.
class FileProcessingError : public LottoLensException {
public:
    FileProcessingError(const std::string& fileName, const std::string& innerMessage)
        : LottoLensException("Error processing file \"" + fileName + "\": " + innerMessage), fileName_(fileName) {}

    const std::string& fileName() const noexcept { return fileName_; }

private:
    std::string fileName_;
};

// Batch-level: nothing survived extraction and merge.
class NoValidDrawsError : public LottoLensException {
public:
    explicit NoValidDrawsError(const std::string& message) : LottoLensException(message) {}
};

} // namespace LottoLens

#endif // LOTTOLENS_EXCEPTIONS_H
