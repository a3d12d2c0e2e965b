#include "recsync/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and exit-code contracts live in the router.
  return recsync::cli::Dispatch(argc, argv);
}
