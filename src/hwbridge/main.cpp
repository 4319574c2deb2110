#include "hwbridge/cli/router.hpp"

int main(int argc, char** argv) {
  return hwbridge::cli::Dispatch(argc, argv);
}
