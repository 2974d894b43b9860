#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// MissingInputError — a rule table or time-series file is absent.
// Per-asset / per-period drivers catch it and skip the unit.
// ---------------------------------------------------------------------------
class MissingInputError : public std::runtime_error {
public:
    explicit MissingInputError(const std::string& path)
        : std::runtime_error("Input file not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
