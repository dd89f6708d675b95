// generator_app/generator_main.cpp
#include "config.hpp"
#include "file_utils.hpp"

using namespace largefile_common;

int main() {
  return run_generator(config::GENERATED_FILE_NAME, config::TARGET_FILE_SIZE,
                       config::LINE_TEXT);
}
