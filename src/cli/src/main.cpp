#include <iostream>

#include "../include/command_controller.hpp"

int main(int argc, char **argv) {
  CommandController controller(std::cout);
  return controller.run(argc, argv);
}
