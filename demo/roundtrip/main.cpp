////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include <pfs/mummy/mummy.hpp>
#include <pfs/argvapi.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <pfs/stopwatch.hpp>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

static constexpr char const * TAG = "roundtrip";

namespace fs = pfs::filesystem;

using record_t = std::pair<std::uint64_t, mummy::string>;
using archive_t = mummy::archive<std::vector<char>>;

static void print_usage (fs::path const & programName
    , std::string const & errorString = std::string{})
{
    if (!errorString.empty())
        LOGE(TAG, "{}", errorString);

    fmt::println("Usage:\n\n"
        "{0} --help | -h\n"
        "{0} [--count=N]\n\n"

        "Options:\n\n"
        "--help | -h\n"
        "\tPrint this help and exit\n"
        "--count=N\n"
        "\tNumber of records to encode and decode (default is 256)\n"
        , programName);
}

static mummy::vector<record_t> make_records (std::size_t count)
{
    mummy::vector<record_t> result;
    result.reserve(count);

    for (std::size_t i = 0; i < count; i++)
        result.push_back(record_t{i, mummy::string{std::to_string(i)}});

    return result;
}

static bool verify (mummy::vector<record_t> const & expected, mummy::slice<record_t> const & decoded)
{
    if (expected.size() != decoded.size()) {
        LOGE(TAG, "size mismatch: expected {}, decoded {}", expected.size(), decoded.size());
        return false;
    }

    for (std::size_t i = 0; i < expected.size(); i++) {
        if (expected[i] != decoded[i]) {
            LOGE(TAG, "record mismatch at index {}", i);
            return false;
        }
    }

    return true;
}

int main (int argc, char * argv[])
{
    std::size_t count = 256;

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("count")) {
            if (!x.has_arg()) {
                print_usage(programName, "Expected number of records");
                return EXIT_FAILURE;
            }

            std::error_code ec;
            count = pfs::to_integer<std::size_t>(x.arg().begin(), x.arg().end()
                , std::size_t{0}, std::size_t{100000000}, ec);

            if (ec) {
                LOGE(TAG, "Bad number of records: {}", x.arg());
                return EXIT_FAILURE;
            }
        } else {
            print_usage(programName, "Bad arguments");
            return EXIT_FAILURE;
        }
    }

    auto records = make_records(count);
    auto expected_size = mummy::measure(records);

    LOGI(TAG, "records: {}, expected encoding size: {} bytes", count, expected_size);

    pfs::stopwatch<std::micro, std::size_t> stopwatch;

    archive_t ar;

    try {
        stopwatch.start();
        mummy::encode(records, ar);
        stopwatch.stop();
    } catch (pfs::error const & ex) {
        LOGE(TAG, "encode failure: {}", ex.what());
        return EXIT_FAILURE;
    }

    LOGI(TAG, "encoded {} bytes in {} us", ar.size(), stopwatch.count());

    // Decoding patches pointers in place
    archive_t encoded {ar};

    stopwatch.start();
    auto result = mummy::decode<record_t>(ar);
    stopwatch.stop();

    if (!result) {
        LOGE(TAG, "decode failure: {}, {} byte(s) left", result.code().message()
            , result.remaining().size());
        return EXIT_FAILURE;
    }

    LOGI(TAG, "decoded {} records in {} us", result->size(), stopwatch.count());

    if (!verify(records, *result))
        return EXIT_FAILURE;

    // Decoded data must encode to the same bytes
    archive_t ar2;
    mummy::encode(*result, ar2);

    if (ar2.size() != encoded.size() || std::memcmp(ar2.data(), encoded.data(), encoded.size()) != 0) {
        LOGE(TAG, "re-encoded data differs from original encoding");
        return EXIT_FAILURE;
    }

    fmt::println("Round trip of {} records ({} bytes): OK", count, ar.size());

    return EXIT_SUCCESS;
}
