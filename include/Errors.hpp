#pragma once
#include <stdexcept>

// Session file is missing the per-stroke section or its table is unusable.
class FormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Every input file of a batch failed.
class NoValidSessionsError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
