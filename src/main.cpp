/*
 * main.cpp - contains main(), mostly.
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <getopt.h>
#include <unistd.h>

using namespace ID3Peek;

static char _about_message[] = "This is ID3Peek version " ID3PEEK_VERSION ".\n"\
            "\n"
            "Copyright © 2025 Kirn Gill II <segin2005@gmail.com>\n"
            "\n"
            "ID3Peek is free software. You may redistribute and/or modify it under\n"
            "the terms of the ISC License <https://opensource.org/licenses/ISC>\n"
            "\n"
            "Written by " ID3PEEK_MAINTAINER "\n";

static char _usage_message[] = "Usage: id3peek [options] <command> <file>\n"\
            "\n"
            "Commands:\n"
            "  info                  Print the tag fields\n"
            "  lyrics                Print the unsynchronised lyrics\n"
            "  picture               Write an embedded picture to standard output\n"
            "  help                  Show this message\n"
            "\n"
            "Options:\n"
            "  -t, --type <type>     Picture type for 'picture' (name or number,\n"
            "                        default: front cover, else the first picture)\n"
            "  -d, --debug <list>    Enable log channels: all, tag, id3v1, id3v2,\n"
            "                        frame, io, cli (comma separated)\n"
            "  -l, --logfile <path>  Write the log to a file instead of stderr\n"
            "  -v, --version         Show version information\n"
            "  -h, --help            Show this message\n";

// Process exit statuses
enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_IO = 2,
    EXIT_NO_TAG = 3,
    EXIT_MISSING = 4
};

struct CommandOptions {
    std::string command;
    std::string file;
    std::optional<Tag::PictureType> picture_type;
    std::string logfile;
    std::vector<std::string> channels;
};

static std::vector<std::string> splitChannels(const std::string& list) {
    std::vector<std::string> channels;
    std::stringstream ss(list);
    std::string channel;
    while (std::getline(ss, channel, ',')) {
        if (!channel.empty()) {
            channels.push_back(channel);
        }
    }
    return channels;
}

static int printInfo(const Tag::Metadata& metadata) {
    if (metadata.isEmpty()) {
        std::cerr << "Tag holds no readable fields" << std::endl;
    }
    for (Tag::CommonField field : Tag::allCommonFields()) {
        std::optional<std::string> value = metadata.getField(field);
        if (value) {
            std::cout << Tag::fieldName(field) << ": " << *value << "\n";
        }
    }
    std::cout << "Format: " << metadata.formatName() << "\n";
    
    const std::vector<Tag::Picture>& pictures = metadata.pictures();
    for (const Tag::Picture& picture : pictures) {
        std::cout << "Picture: " << Tag::pictureTypeName(picture.type) << ", "
                  << picture.mime_type << ", " << picture.data.size() << " bytes";
        if (picture.width && picture.height) {
            std::cout << ", " << picture.width << "x" << picture.height;
        }
        std::cout << "\n";
    }
    
    if (!metadata.warnings().empty()) {
        std::cout << "Warnings: " << metadata.warnings().size() << "\n";
    }
    return EXIT_OK;
}

static int printLyrics(const Tag::Metadata& metadata) {
    std::vector<Tag::CommentEntry> lyrics = metadata.lyrics();
    if (lyrics.empty()) {
        std::cout << "Lyrics not available" << std::endl;
        return EXIT_MISSING;
    }
    
    for (size_t i = 0; i < lyrics.size(); ++i) {
        if (i > 0) {
            std::cout << "\n";
        }
        std::cout << lyrics[i].text << "\n";
    }
    return EXIT_OK;
}

static int writePicture(const Tag::Metadata& metadata, const CommandOptions& options) {
    const Tag::Picture* picture = options.picture_type
                                      ? metadata.findPicture(*options.picture_type)
                                      : metadata.frontCover();
    if (!picture) {
        std::cerr << "id3peek: no matching picture in " << options.file << std::endl;
        return EXIT_MISSING;
    }
    
    if (isatty(STDOUT_FILENO)) {
        std::cerr << "id3peek: refusing to write " << picture->mime_type
                  << " data to a terminal; redirect standard output" << std::endl;
        return EXIT_USAGE;
    }
    
    Debug::log("cli", "writePicture: ", Tag::pictureTypeName(picture->type), ", ",
               picture->data.size(), " bytes");
    std::cout.write(reinterpret_cast<const char*>(picture->data.data()),
                    static_cast<std::streamsize>(picture->data.size()));
    std::cout.flush();
    if (!std::cout) {
        std::cerr << "id3peek: failed to write picture data" << std::endl;
        return EXIT_IO;
    }
    return EXIT_OK;
}

static int runCommand(const CommandOptions& options) {
    IO::File::FileIOHandler source(options.file);
    Tag::Metadata metadata = Tag::TagReader::parse(source);
    
    for (const Tag::ParseWarning& warning : metadata.warnings()) {
        DEBUG_LOG_LAZY("cli", "runCommand: warning [", errorName(warning.code), "] ",
                       warning.frame_id.empty() ? std::string("tag") : warning.frame_id,
                       " @", warning.offset, ": ", warning.message);
    }
    
    if (options.command == "info") {
        return printInfo(metadata);
    } else if (options.command == "lyrics") {
        return printLyrics(metadata);
    }
    return writePicture(metadata, options);
}

int main(int argc, char *argv[]) {
    // --- Argument Parsing ---
    CommandOptions options;

    static const struct option long_options[] = {
        {"type", required_argument, 0, 't'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "t:d:l:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 't':
                options.picture_type = Tag::pictureTypeFromString(optarg);
                if (!options.picture_type) {
                    std::cerr << "id3peek: unknown picture type '" << optarg << "'" << std::endl;
                    return EXIT_USAGE;
                }
                break;
            case 'd':
                options.channels = splitChannels(optarg);
                break;
            case 'l':
                options.logfile = optarg;
                break;
            case 'v':
                std::cout << _about_message << std::endl;
                return EXIT_OK;
            case 'h':
                std::cout << _usage_message;
                return EXIT_OK;
            case '?': // Invalid option
                return EXIT_USAGE; // getopt_long already prints an error message.
        }
    }

    if (optind < argc) {
        options.command = argv[optind];
    }
    if (options.command == "help") {
        std::cout << _usage_message;
        return EXIT_OK;
    }
    if (options.command != "info" && options.command != "lyrics" && options.command != "picture") {
        if (!options.command.empty()) {
            std::cerr << "id3peek: unknown command '" << options.command << "'\n";
        }
        std::cerr << _usage_message;
        return EXIT_USAGE;
    }
    if (argc - optind != 2) {
        std::cerr << "id3peek: '" << options.command << "' takes exactly one file\n" << _usage_message;
        return EXIT_USAGE;
    }
    options.file = argv[optind + 1];

    if (!options.channels.empty() || !options.logfile.empty()) {
        Debug::init(options.logfile, options.channels);
    }
    Debug::log("cli", "main: ", options.command, " ", options.file);

    int status;
    try {
        status = runCommand(options);
    } catch (const IOException& e) {
        std::cerr << "id3peek: " << options.file << ": " << e.what() << std::endl;
        status = EXIT_IO;
    } catch (const TagException& e) {
        std::cerr << "id3peek: " << options.file << ": " << e.what()
                  << " (" << errorName(e.code()) << ")" << std::endl;
        status = EXIT_NO_TAG;
    }

    Debug::shutdown();
    return status;
}
