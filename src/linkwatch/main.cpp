#include "linkwatch/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing, signal handling and exit codes all live in the router.
  return linkwatch::cli::Dispatch(argc, argv);
}
