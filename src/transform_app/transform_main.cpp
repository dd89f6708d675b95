// transform_app/transform_main.cpp
#include "config.hpp"
#include "line_transformer.hpp"

#include <iostream>

using namespace largefile_common;

int main() {
  try {
    std::cout << "Transformer: " << config::GENERATED_FILE_NAME << " -> "
              << config::TRANSFORMED_FILE_NAME << ", chunk size: "
              << config::CHUNK_SIZE / 1024.0 << " KB." << std::endl;

    transform_file(config::GENERATED_FILE_NAME, config::TRANSFORMED_FILE_NAME,
                   config::CHUNK_SIZE);
  } catch (const std::exception &e) {
    std::cerr << "Transformer Exception in main: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
