#include "rolelaunch/cli/router.hpp"

int main(int argc, char** argv) {
  return rolelaunch::cli::Dispatch(argc, argv);
}
