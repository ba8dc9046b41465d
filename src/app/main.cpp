#include <iostream>
#include <cstdlib>

#include "notesd/app/application.hpp"

int main(int argc, char* argv[]) {
  try {
    notesd::app::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
