#pragma once

// Shared entrypoint for the rompatch command line tool.
//
// Kept separate from main() so the end-to-end CLI tests can drive the exact
// same code path in-process.
//
// Implementation: src/cli/main.cpp

namespace rompatch {

int RomPatchCliMain(int argc, char** argv);

} // namespace rompatch
