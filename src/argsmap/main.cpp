#include "argsmap/cli/router.hpp"

int main(int argc, char** argv) {
  // All parsing and exit-code contracts live in the CLI router.
  return argsmap::cli::Dispatch(argc, argv);
}
