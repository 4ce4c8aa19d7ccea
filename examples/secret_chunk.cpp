/**
 * @file secret_chunk.cpp
 * @brief Hide a message in a private ancillary chunk and read it back
 *
 * Builds a chunk of type "ruSt" around the message, writes the encoded
 * record to a file, then decodes the file and prints what it found.
 */

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cout << "Usage: " << argv[0] << " <output file> [message]\n";
        std::cout << "\n";
        std::cout << "Writes the message as a single chunk, then reads it back.\n";
        return 1;
    }

    std::string message = argc == 3 ? argv[2] : "This is where your secret message will be!";

    try {
        std::vector<std::byte> payload(message.size());
        std::transform(message.begin(), message.end(), payload.begin(),
                       [](char c) { return static_cast<std::byte>(c); });

        pngme::chunk secret(pngme::chunk_type::from_string("ruSt"), std::move(payload));
        {
            std::ofstream out(argv[1], std::ios::binary);
            if (!out) {
                std::cerr << "Error: Cannot create file '" << argv[1] << "'\n";
                return 1;
            }
            secret.write(out);
        }
        std::cout << "Wrote " << secret << "\n";

        std::ifstream in(argv[1], std::ios::binary);
        if (!in) {
            std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
            return 1;
        }

        pngme::parse_options opts;
        opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view msg) {
            std::cerr << "Warning [" << category << "] at " << offset << ": " << msg << "\n";
        };

        while (auto c = pngme::chunk::read(in, opts)) {
            std::cout << "Read  " << *c << "\n";
            std::cout << "  critical=" << c->type().is_critical()
                      << " public=" << c->type().is_public()
                      << " safe_to_copy=" << c->type().is_safe_to_copy() << "\n";
            std::cout << "  message: " << c->data_as_string() << "\n";
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
