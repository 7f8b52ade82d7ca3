#include <LogCompat.hpp>

#include "SpdlogInit.hpp"

extern int app_main(int argc, char** argv);

int main(int argc, char** argv) {
    HashCore_SpdlogInit();
    if (argc > 0 && argv[0] != nullptr) {
        DLOG(INFO) << "Launching " << argv[0] << " with " << argc << " args";
    }
    const int ret = app_main(argc, argv);
    HashCore_SpdlogDeInit();
    return ret;
}
