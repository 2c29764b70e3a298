/*

rebuild.cpp
-----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Decomposes a message file, prints its structure to the error stream and writes the rebuilt message to the output.
An optional field name and value are set in the top level header first, keeping the rest of the original header untouched.

Usage: rebuild <file.eml> [<field> <value>]

*/


#include <cstdlib>
#include <iostream>
#include <string>
#include <mimetree/mimetree.hpp>


using std::cerr;
using std::cout;
using std::string;
using mimetree::builder;
using mimetree::decomposer;
using mimetree::format_structure;


int main(int argc, char* argv[])
{
    if (argc != 2 && argc != 4)
    {
        cerr << "Usage: " << argv[0] << " <file.eml> [<field> <value>]\n";
        return EXIT_FAILURE;
    }

    decomposer dec;
    auto msg = dec.decompose_file(argv[1]);
    if (!msg)
    {
        cerr << "decompose error: " << msg.error().to_string() << '\n';
        return EXIT_FAILURE;
    }

    cerr << format_structure(**msg);

    builder bld;
    if (argc == 4)
        bld.set_header_field(**msg, argv[2], argv[3]);
    cout << bld.build(**msg);
    return EXIT_SUCCESS;
}
