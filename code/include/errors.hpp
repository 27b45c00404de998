#pragma once
#include <stdexcept>
#include <string>

struct HeatgridError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// malformed or out-of-canvas geometry
struct InvalidBoxError : HeatgridError {
  using HeatgridError::HeatgridError;
};

// grids of different resolutions must never meet
struct ResolutionMismatchError : HeatgridError {
  ResolutionMismatchError(int rows_a, int cols_a, int rows_b, int cols_b)
    : HeatgridError("resolution mismatch: " + std::to_string(rows_a) + "x" + std::to_string(cols_a) +
                    " vs " + std::to_string(rows_b) + "x" + std::to_string(cols_b)) {}
};

struct EmptyCorpusError : HeatgridError {
  EmptyCorpusError() : HeatgridError("empty corpus: no records absorbed") {}
};

struct AggregationCancelled : HeatgridError {
  explicit AggregationCancelled(unsigned long long absorbed)
    : HeatgridError("aggregation cancelled after " + std::to_string(absorbed) + " records") {}
};

struct ConfigError : HeatgridError {
  using HeatgridError::HeatgridError;
};
