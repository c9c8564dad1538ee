#include "sweval/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and exit-code contracts live in the CLI router.
  return sweval::cli::Dispatch(argc, argv);
}
