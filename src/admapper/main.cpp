#include "admapper/cli/router.hpp"

int main(int argc, char** argv) {
  return admapper::cli::Dispatch(argc, argv);
}
