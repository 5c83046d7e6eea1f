#pragma once

#include <stdexcept>
#include <string>

namespace czistack {

/*
  Base of every error the conversion pipeline raises.
  stage() names the pipeline step that failed, so the CLI can report
  "<file>: <stage> error: <message>".
*/
class Error : public std::runtime_error {
public:
    Error(const std::string& stage, const std::string& what)
        : std::runtime_error(what), stage_(stage) {}

    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

/* Malformed #AARRGGBB color string. */
class FormatError : public Error {
public:
    explicit FormatError(const std::string& what) : Error("color", what) {}
};

/* Input is not a readable 8-bit CZI container. */
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& what) : Error("decode", what) {}
};

/* Channel metadata missing, incomplete or inconsistent with the pixel data. */
class MetadataError : public Error {
public:
    explicit MetadataError(const std::string& what) : Error("metadata", what) {}
};

/* Destination directory is already present. */
class OutputExistsError : public Error {
public:
    explicit OutputExistsError(const std::string& what) : Error("output", what) {}
};

/* Filesystem or raster write failure. */
class IOError : public Error {
public:
    explicit IOError(const std::string& what) : Error("export", what) {}
};

} // namespace czistack
