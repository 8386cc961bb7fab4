/**
 * @file resource_mover_main.cpp
 * @brief resource_mover - Main Entry Point
 *
 * Moves Android resources out of a shared module into the modules that
 * use them, or deletes the resources nothing references.
 *
 * Usage:
 *   resource_mover move -s core -o feature_a -o feature_b -d app
 *   resource_mover remove -s core -d app -i string --skip "^keep_"
 *   resource_mover --help
 */

#include "ResourceMover/app/resource_mover_app.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
  ResourceMover::app::ResourceMoverApp app(std::cout, std::cerr);
  return app.run(argc, argv);
}
