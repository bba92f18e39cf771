#include <iostream>

#include "Demo.hpp"

int main(int argc, char * argv[]) {
  return fr::skeleton::runDemo(argc > 1 ? argv[1] : nullptr, std::cout);
}
