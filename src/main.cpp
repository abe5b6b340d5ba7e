#include "functions/config/src/config.hpp"
#include "functions/epub_reader/src/epub_reader.hpp"
#include "functions/summary/src/summary.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace epubkit;

static void print_usage() {
    std::cerr << "Usage: epubkit-cli info <book.epub>\n"
                 "       epubkit-cli toc <book.epub>\n"
                 "       epubkit-cli rewrite <in.epub> <out.epub>\n"
                 "       epubkit-cli ls <book.epub> [dir]\n";
}

static void list_directory(const Directory& dir, int depth) {
    for (const Resource& r : dir.list_entries()) {
        std::cout << capability_flags(r) << "  " << std::string(static_cast<size_t>(depth) * 2, ' ')
                  << path_of(r).name();
        if (const Directory* d = std::get_if<Directory>(&r)) {
            std::cout << "/\n";
            list_directory(*d, depth + 1);
        } else if (const File* f = std::get_if<File>(&r)) {
            std::cout << "  " << f->file_size() << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }
    const std::string command = argv[1];
    const fs::path path = argv[2];

    try {
        // 작업 디렉토리의 .env
        Config config = load_config(".env");
        apply_config(config);
        PackageWriteOptions write_options;
        write_options.omit_legacy = config.omit_legacy;
        write_options.indent = config.xml_indent;

        Epub epub = open_epub(path);

        if (command == "info") {
            std::cout << summarize(epub).dump(2) << "\n";
        } else if (command == "toc") {
            std::cout << toc_to_json(epub.table_of_contents()).dump(2) << "\n";
        } else if (command == "rewrite") {
            if (argc < 4) {
                print_usage();
                return 1;
            }
            epub.save(argv[3], write_options);
            std::cout << "[info] Saved " << argv[3] << "\n";
        } else if (command == "ls") {
            std::string dir = argc >= 4 ? argv[3] : "/";
            list_directory(require_directory(epub.file_system().get_path(dir)), 0);
        } else {
            print_usage();
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
