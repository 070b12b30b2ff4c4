#pragma once

#include <UtilsExports.h>

class Utils_API CommandLine {
   public:
    using argv_type = char* const*;
    using argc_type = int;

   private:
    argc_type _argc;
    argv_type _argv;

   public:
    // Throws std::invalid_argument for a null argv.
    CommandLine(argc_type argc, argv_type argv);
    [[nodiscard]] argv_type argv() const;
    [[nodiscard]] argc_type argc() const;
};
