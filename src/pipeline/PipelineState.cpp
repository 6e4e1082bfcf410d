#include "buyplan/pipeline/PipelineState.h"

namespace buyplan::pipeline {

const char* stageName(int stage) {
  switch (stage) {
    case 0: return StageTraits<0>::name;
    case 1: return StageTraits<1>::name;
    case 2: return StageTraits<2>::name;
    case 3: return StageTraits<3>::name;
    case 4: return StageTraits<4>::name;
    case 5: return StageTraits<5>::name;
    case 6: return StageTraits<6>::name;
    case 7: return StageTraits<7>::name;
    case 8: return StageTraits<8>::name;
    default: return "?";
  }
}

template <int N>
static std::optional<StageOutput> tagged(const PipelineState& s) {
  const auto* out = stageSlot<N>(s);
  if (!out) return std::nullopt;
  return StageOutput{std::in_place_index<N>, *out};
}

std::optional<StageOutput> stageOutput(const PipelineState& s, int stage) {
  switch (stage) {
    case 0: return tagged<0>(s);
    case 1: return tagged<1>(s);
    case 2: return tagged<2>(s);
    case 3: return tagged<3>(s);
    case 4: return tagged<4>(s);
    case 5: return tagged<5>(s);
    case 6: return tagged<6>(s);
    case 7: return tagged<7>(s);
    case 8: return tagged<8>(s);
    default: return std::nullopt;
  }
}

} // namespace buyplan::pipeline
