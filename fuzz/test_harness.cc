// Plain harness for fuzz targets built without libFuzzer
// Replays every file named on the command line, or stdin if none.

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

namespace {

int replay(const std::string& input) {
  return LLVMFuzzerTestOneInput(
    reinterpret_cast<const uint8_t*>(input.data()),
    input.size()
  );
}

} // anonymous namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::stringstream buffer;
    buffer << std::cin.rdbuf();
    return replay(buffer.str());
  }

  for (int i = 1; i < argc; ++i) {
    std::ifstream file(argv[i], std::ios::binary);
    if (!file) {
      std::cerr << "Cannot open file: " << argv[i] << std::endl;
      return 1;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::cout << argv[i] << ": " << buffer.str().size() << " bytes" << std::endl;

    int result = replay(buffer.str());
    if (result != 0)
      return result;
  }

  return 0;
}
