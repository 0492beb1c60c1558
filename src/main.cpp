#include "cli/CliMain.hpp"

int main(int argc, char** argv)
{
  return rompatch::RomPatchCliMain(argc, argv);
}
