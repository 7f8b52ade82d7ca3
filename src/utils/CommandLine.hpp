#pragma once

#include <HashCoreUtilsExports.h>

// Non-owning view of main()'s argc/argv.
class HashCoreUtils_API CommandLine {
   public:
    using argv_type = char* const*;
    using argc_type = int;

   private:
    argc_type _argc;
    argv_type _argv;

   public:
    // Throws std::invalid_argument if argv or argv[0] is null.
    CommandLine(argc_type argc, argv_type argv);
    [[nodiscard]] argv_type argv() const;
    [[nodiscard]] argc_type argc() const;

    bool operator==(const CommandLine& other) const;
};
