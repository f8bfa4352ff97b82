#pragma once

// ============================================================
// errors.hpp -- Error taxonomy for chunk encode/decode/rebuild
//
// Scope of each error:
//   FormatError               one record; the record is skipped
//   MissingPartsError         one file
//   InconsistentMetadataError one file
//   ChunkIntegrityError       one file
//   FileIntegrityError        one file
//   DecryptionError           one record (first one of a run re-prompts)
//   InputError                whole operation, raised before chunk work
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>
#include <vector>

class QrcpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InputError : public QrcpError {
public:
    using QrcpError::QrcpError;
};

class FormatError : public QrcpError {
public:
    using QrcpError::QrcpError;
};

class DecryptionError : public QrcpError {
public:
    using QrcpError::QrcpError;
};

class InconsistentMetadataError : public QrcpError {
public:
    using QrcpError::QrcpError;
};

class MissingPartsError : public QrcpError {
public:
    MissingPartsError(const std::string& msg, std::vector<u32> missing)
        : QrcpError(msg), missing_(std::move(missing)) {}

    // Sorted ascending
    const std::vector<u32>& missing() const { return missing_; }

private:
    std::vector<u32> missing_;
};

class ChunkIntegrityError : public QrcpError {
public:
    ChunkIntegrityError(u32 index, const std::string& expected, const std::string& actual)
        : QrcpError("chunk " + std::to_string(index) + " hash mismatch: expected " +
                    expected + ", got " + actual)
        , index_(index), expected_(expected), actual_(actual) {}

    u32 index() const { return index_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    u32 index_;
    std::string expected_;
    std::string actual_;
};

class FileIntegrityError : public QrcpError {
public:
    FileIntegrityError(const std::string& expected, const std::string& actual)
        : QrcpError("file hash mismatch: expected " + expected + ", got " + actual)
        , expected_(expected), actual_(actual) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};
