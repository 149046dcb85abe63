/**
 * @file cli.cpp
 * @brief PESEL command line interface.
 *
 * Validates a single PESEL or generates one from a birth date and sex.
 */

#include <pesel/peselcodec.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <string>

using namespace pesel;

static void print_version() {
    std::printf("pesel %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("PESEL validator and generator (v%s C++)\n", version());
    std::printf("========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <number>\n", prog_name);
    std::printf("  %s -g <YYYY-MM-DD> <m|f> [serial]\n", prog_name);
    std::printf("  %s -r <YYYY-MM-DD> <m|f>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -g             Generate with a fixed sequence number (default 0)\n");
    std::printf("  -r             Generate with a random sequence number\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  number         11-digit PESEL to validate\n");
    std::printf("  YYYY-MM-DD     Date of birth, years 1800-2299\n");
    std::printf("  m|f            Sex (male or female)\n");
    std::printf("  serial         Sequence number 0-999\n\n");
    std::printf("Examples:\n");
    std::printf("  %s 44051401458                # validate\n", prog_name);
    std::printf("  %s -g 1980-05-26 m            # generate\n", prog_name);
    std::printf("  %s -r 2004-02-29 f            # generate (random)\n\n", prog_name);
}

// Strict YYYY-MM-DD: exactly 10 characters, dashes at 4 and 7.
static bool parse_date(const char* text, int& year, int& month, int& day) {
    if (std::strlen(text) != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (int i = 0; i < 10; ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    year = std::atoi(text);
    month = std::atoi(text + 5);
    day = std::atoi(text + 8);
    return true;
}

static bool parse_sex(const char* text, Sex& sex) {
    if (std::strcmp(text, "m") == 0 || std::strcmp(text, "male") == 0) {
        sex = Sex::Male;
        return true;
    }
    if (std::strcmp(text, "f") == 0 || std::strcmp(text, "female") == 0) {
        sex = Sex::Female;
        return true;
    }
    return false;
}

static bool parse_serial(const char* text, int& serial) {
    std::size_t len = std::strlen(text);
    if (len == 0 || len > 3) {
        return false;
    }
    for (std::size_t i = 0; i < len; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    serial = std::atoi(text);
    return true;
}

static int do_validate(const char* number) {
    auto result = parse(number);
    if (!result) {
        std::fprintf(stderr, "Error: %s: %s\n", number, error_string(result.error()));
        return 1;
    }

    std::printf("%s\n", result->describe().c_str());
    return 0;
}

static int report_generated(const Result<Pesel, GenerationError>& result) {
    if (!result) {
        std::fprintf(stderr, "Error: %s\n", error_string(result.error()));
        return 1;
    }

    std::printf("%s\n", result->to_string().c_str());
    return 0;
}

static bool parse_birth_args(const char* date_arg, const char* sex_arg, int& year, int& month,
                             int& day, Sex& sex) {
    if (!parse_date(date_arg, year, month, day)) {
        std::fprintf(stderr, "Error: Date must be YYYY-MM-DD, got '%s'\n", date_arg);
        return false;
    }
    if (!parse_sex(sex_arg, sex)) {
        std::fprintf(stderr, "Error: Sex must be 'm' or 'f', got '%s'\n", sex_arg);
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    Sex sex = Sex::Female;

    if (std::strcmp(argv[1], "-g") == 0) {
        // Generate mode: -g <YYYY-MM-DD> <m|f> [serial]
        if (argc != 4 && argc != 5) {
            std::fprintf(stderr, "Error: Generate requires 2 or 3 arguments after -g\n");
            std::fprintf(stderr, "Usage: %s -g <YYYY-MM-DD> <m|f> [serial]\n", argv[0]);
            return 1;
        }
        if (!parse_birth_args(argv[2], argv[3], year, month, day, sex)) {
            return 1;
        }

        int serial = 0;
        if (argc == 5 && !parse_serial(argv[4], serial)) {
            std::fprintf(stderr, "Error: serial must be 0-999\n");
            return 1;
        }

        return report_generated(generate(year, month, day, sex, serial));
    }

    if (std::strcmp(argv[1], "-r") == 0) {
        // Random mode: -r <YYYY-MM-DD> <m|f>
        if (argc != 4) {
            std::fprintf(stderr, "Error: Random generate requires 2 arguments after -r\n");
            std::fprintf(stderr, "Usage: %s -r <YYYY-MM-DD> <m|f>\n", argv[0]);
            return 1;
        }
        if (!parse_birth_args(argv[2], argv[3], year, month, day, sex)) {
            return 1;
        }

        std::random_device rd;
        std::mt19937 rng(rd());
        return report_generated(generate_random(year, month, day, sex, rng));
    }

    // Validate mode: <number>
    if (argc != 2) {
        std::fprintf(stderr, "Error: Validate takes exactly one number\n");
        std::fprintf(stderr, "Usage: %s <number>\n", argv[0]);
        return 1;
    }

    return do_validate(argv[1]);
}
