#pragma once

#include <unpack/frame_engine.hpp>
#include <unpack/unpack_plan.hpp>

namespace unpack {

  struct execute_options {
    // Throw when a step targets a column the frame does not have, instead
    // of skipping it with a warning.
    bool fail_fast = false;
  };

  // Applies the steps, adds typed nulls for the columns still missing, then
  // keeps exactly plan.columns. A skipped step skips everything planned
  // under its path; a source column that merely shares a name with a leaf
  // of that subtree is replaced by nulls.
  void
  execute(const unpack_plan& plan, frame_engine& engine,
          const execute_options& opts = {});

} // namespace unpack
