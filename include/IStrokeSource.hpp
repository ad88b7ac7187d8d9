#pragma once
#include "StrokeRow.hpp"

class IStrokeSource {
public:
  virtual ~IStrokeSource() = default;
  virtual bool next(StrokeRow& out) = 0;
};
