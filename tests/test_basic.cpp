#include <cstdlib>
#include <iostream>
#include <string>

int main() {
    // Minimal check that the built tool runs and prints its usage
    std::string cmd = std::string("\"") + SNPLOF_MERGER_BIN + "\" --help > /dev/null";
    int ret = std::system(cmd.c_str());
    if (ret != 0) {
        std::cerr << "SNPLOF_merger --help returned non-zero!\n";
        return 1;
    }

    std::cout << "test_basic passed.\n";
    return 0;
}
