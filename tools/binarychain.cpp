/* SPDX-License-Identifier: MPL-2.0 */

#include <bchain.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/write.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace
{
const size_t default_chunk_size = 4096;
const int64_t default_max_part_length = 1024 * 1024;
const int64_t default_max_chain_size = 10 * 1024 * 1024;
const int64_t default_max_part_count = 256;
const size_t dump_row_bytes = 40;

//  Blocking file descriptor I/O through Asio. Short reads are passed on
//  as they come so the decoder sees the same chunking a socket gives.
class descriptor_t
{
  public:
    descriptor_t () : _descriptor (_io_context) {}

    int open_read (const std::string &path_)
    {
        const int fd = path_ == "-" ? dup (STDIN_FILENO)
                                    : ::open (path_.c_str (), O_RDONLY);
        return assign (fd);
    }

    int open_write (const std::string &path_)
    {
        const int fd =
          path_ == "-"
            ? dup (STDOUT_FILENO)
            : ::open (path_.c_str (), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        return assign (fd);
    }

    //  Returns the number of bytes read, 0 at end of input, -1 on error.
    long read_some (unsigned char *buf_, size_t size_)
    {
        boost::system::error_code ec;
        const size_t n =
          _descriptor.read_some (boost::asio::buffer (buf_, size_), ec);
        if (ec == boost::asio::error::eof)
            return 0;
        if (ec) {
            errno = ec.value ();
            return -1;
        }
        return static_cast<long> (n);
    }

    int write_all (const void *data_, size_t size_)
    {
        boost::system::error_code ec;
        boost::asio::write (_descriptor, boost::asio::buffer (data_, size_),
                            ec);
        if (ec) {
            errno = ec.value ();
            return -1;
        }
        return 0;
    }

  private:
    int assign (int fd_)
    {
        if (fd_ == -1)
            return -1;
        boost::system::error_code ec;
        _descriptor.assign (fd_, ec);
        if (ec) {
            ::close (fd_);
            errno = ec.value ();
            return -1;
        }
        return 0;
    }

    boost::asio::io_context _io_context;
    boost::asio::posix::stream_descriptor _descriptor;
};

int read_file (const std::string &path_, std::vector<unsigned char> &out_)
{
    descriptor_t input;
    if (input.open_read (path_) == -1)
        return -1;

    out_.clear ();
    unsigned char buf[default_chunk_size];
    while (true) {
        const long n = input.read_some (buf, sizeof buf);
        if (n < 0)
            return -1;
        if (n == 0)
            return 0;
        out_.insert (out_.end (), buf, buf + n);
    }
}

int write_file (const std::string &path_, const void *data_, size_t size_)
{
    descriptor_t output;
    if (output.open_write (path_) == -1)
        return -1;
    return output.write_all (data_, size_);
}

std::string base_name (const std::string &path_)
{
    if (path_ == "-")
        return "stdin";
    const std::string::size_type slash = path_.find_last_of ('/');
    return slash == std::string::npos ? path_ : path_.substr (slash + 1);
}

bool starts_with (const std::string &arg_, const char *prefix_)
{
    return arg_.compare (0, strlen (prefix_), prefix_) == 0;
}

bool parse_size (const std::string &text_, int64_t &value_)
{
    if (text_.empty ())
        return false;
    char *end = NULL;
    errno = 0;
    const long long value = strtoll (text_.c_str (), &end, 10);
    if (errno != 0 || *end != '\0' || value < -1)
        return false;
    value_ = static_cast<int64_t> (value);
    return true;
}

char printable (unsigned char c_)
{
    return c_ >= 0x20 && c_ < 0x7f ? static_cast<char> (c_) : '.';
}

//  Hex and character dump, dump_row_bytes per row.
void dump (const unsigned char *data_, size_t size_)
{
    char cell[8];
    for (size_t row = 0; row < size_; row += dump_row_bytes) {
        const size_t n =
          size_ - row < dump_row_bytes ? size_ - row : dump_row_bytes;
        snprintf (cell, sizeof cell, "%06zx", row);
        std::cout << "  " << cell << "  ";
        for (size_t i = 0; i < dump_row_bytes; ++i) {
            if (i < n) {
                snprintf (cell, sizeof cell, "%02x", data_[row + i]);
                std::cout << cell;
            } else
                std::cout << "  ";
        }
        std::cout << "  ";
        for (size_t i = 0; i < n; ++i)
            std::cout << printable (data_[row + i]);
        std::cout << "\n";
    }
}

void print_error (const char *what_, const std::string &subject_)
{
    std::cerr << "binarychain: " << what_ << " " << subject_ << ": "
              << bchain_strerror (errno) << std::endl;
}

void usage ()
{
    std::cerr
      << "usage: binarychain encode [--prefix=P | --noprefix]\n"
         "                          [--output-file=F] [--verify] [files...]\n"
         "       binarychain decode [--output-dir=D] [--chunk-size=N]\n"
         "                          [--max-prefix-length=N] "
         "[--max-part-length=N]\n"
         "                          [--max-part-count=N] "
         "[--max-chain-size=N] file\n"
         "       binarychain view file\n";
}

int cmd_encode (const std::vector<std::string> &args_)
{
    bool have_prefix = false;
    std::string prefix;
    std::string output_file;
    bool verify = false;
    std::vector<std::string> files;

    for (size_t i = 0; i < args_.size (); ++i) {
        const std::string &arg = args_[i];
        if (starts_with (arg, "--prefix=")) {
            prefix = arg.substr (strlen ("--prefix="));
            have_prefix = true;
        } else if (arg == "--noprefix") {
            prefix.clear ();
            have_prefix = true;
        } else if (starts_with (arg, "--output-file="))
            output_file = arg.substr (strlen ("--output-file="));
        else if (arg == "--verify")
            verify = true;
        else if (starts_with (arg, "--")) {
            usage ();
            return 2;
        } else
            files.push_back (arg);
    }
    if (verify && (output_file.empty () || output_file == "-")) {
        std::cerr << "binarychain: --verify needs --output-file" << std::endl;
        return 2;
    }

    std::vector<bchain::part_t> parts;
    for (size_t i = 0; i < files.size (); ++i) {
        bchain::part_t content;
        if (read_file (files[i], content) == -1) {
            print_error ("cannot read", files[i]);
            return 1;
        }
        if (i == 0 && !have_prefix)
            prefix.assign (content.begin (), content.end ());
        else
            parts.push_back (content);
    }

    std::vector<unsigned char> encoded;
    if (bchain::encode (prefix, parts, encoded) != 0) {
        print_error ("cannot encode", "chain");
        return 1;
    }

    if (verify) {
        std::vector<unsigned char> existing;
        if (read_file (output_file, existing) == -1) {
            print_error ("cannot read", output_file);
            return 1;
        }
        if (existing != encoded) {
            std::cout << "Mismatch: " << output_file << " differs ("
                      << existing.size () << " bytes on disk, "
                      << encoded.size () << " bytes encoded)" << std::endl;
            return 1;
        }
        std::cout << "Match: " << output_file << " (" << encoded.size ()
                  << " bytes)" << std::endl;
        return 0;
    }

    if (output_file.empty ()) {
        std::cout << "Encoded chain, " << encoded.size () << " bytes\n";
        dump (&encoded[0], encoded.size ());
        return 0;
    }
    if (write_file (output_file, &encoded[0], encoded.size ()) == -1) {
        print_error ("cannot write", output_file);
        return 1;
    }
    return 0;
}

int write_chain (const std::string &dir_,
                 const std::string &base_,
                 size_t number_,
                 const bchain::event_t &chain_)
{
    const std::string stem =
      dir_ + "/" + base_ + "-chain-" + std::to_string (number_);

    const std::string prefix_file = stem + "-asc-prefix.txt";
    if (write_file (prefix_file, chain_.prefix.data (), chain_.prefix.size ())
        == -1) {
        print_error ("cannot write", prefix_file);
        return -1;
    }
    for (size_t i = 0; i < chain_.parts.size (); ++i) {
        const std::string part_file =
          stem + "-bin-part-" + std::to_string (i) + ".data";
        const bchain::part_t &part = chain_.parts[i];
        if (write_file (part_file, part.empty () ? NULL : &part[0],
                        part.size ())
            == -1) {
            print_error ("cannot write", part_file);
            return -1;
        }
    }
    return 0;
}

void print_chain (size_t number_, const bchain::event_t &chain_)
{
    std::cout << "Chain " << number_ << "\n";
    std::cout << "  Prefix (" << chain_.prefix.size () << " bytes): ";
    for (size_t i = 0; i < chain_.prefix.size (); ++i)
        std::cout << printable (
          static_cast<unsigned char> (chain_.prefix[i]));
    std::cout << "\n";
    if (chain_.parts.empty ()) {
        std::cout << "  No Binary Parts\n";
        return;
    }
    for (size_t i = 0; i < chain_.parts.size (); ++i) {
        const bchain::part_t &part = chain_.parts[i];
        std::cout << "  Part " << i << " (" << part.size () << " bytes)\n";
        if (!part.empty ())
            dump (&part[0], part.size ());
    }
}

int cmd_decode (const std::vector<std::string> &args_)
{
    bchain::limits_t limits;
    limits.set (bchain::limit_option::max_part_length, default_max_part_length)
      .set (bchain::limit_option::max_chain_size, default_max_chain_size)
      .set (bchain::limit_option::max_part_count, default_max_part_count);

    std::string output_dir;
    size_t chunk_size = default_chunk_size;
    std::string file;

    for (size_t i = 0; i < args_.size (); ++i) {
        const std::string &arg = args_[i];
        const std::string::size_type eq = arg.find ('=');
        const std::string name = arg.substr (0, eq);
        const std::string value =
          eq == std::string::npos ? std::string () : arg.substr (eq + 1);
        int64_t number = 0;

        if (name == "--output-dir" && !value.empty ())
            output_dir = value;
        else if (name == "--chunk-size" && parse_size (value, number)
                 && number > 0)
            chunk_size = static_cast<size_t> (number);
        else if (name == "--max-prefix-length" && parse_size (value, number))
            limits.set (bchain::limit_option::max_prefix_length, number);
        else if (name == "--max-part-length" && parse_size (value, number))
            limits.set (bchain::limit_option::max_part_length, number);
        else if (name == "--max-part-count" && parse_size (value, number))
            limits.set (bchain::limit_option::max_part_count, number);
        else if (name == "--max-chain-size" && parse_size (value, number))
            limits.set (bchain::limit_option::max_chain_size, number);
        else if (!starts_with (arg, "--") && file.empty ())
            file = arg;
        else {
            usage ();
            return 2;
        }
    }
    if (file.empty ()) {
        usage ();
        return 2;
    }

    bchain::stream_decoder_t decoder (limits);
    if (!decoder.valid ()) {
        print_error ("cannot create decoder for", file);
        return 1;
    }

    descriptor_t input;
    if (input.open_read (file) == -1) {
        print_error ("cannot read", file);
        return 1;
    }

    const std::string base = base_name (file);
    std::vector<unsigned char> chunk (chunk_size);
    size_t total = 0;
    size_t chains = 0;

    while (true) {
        const long n = input.read_some (&chunk[0], chunk.size ());
        if (n < 0) {
            print_error ("cannot read", file);
            return 1;
        }
        if (n == 0)
            break;
        total += static_cast<size_t> (n);

        std::vector<bchain::event_t> events;
        const int rc =
          decoder.feed (&chunk[0], static_cast<size_t> (n), events);
        for (size_t i = 0; i < events.size (); ++i) {
            const bchain::event_t &event = events[i];
            if (event.type != bchain::event_type::chain)
                continue;
            ++chains;
            if (output_dir.empty ())
                print_chain (chains, event);
            else if (write_chain (output_dir, base, chains, event) == -1)
                return 1;
        }
        if (rc < 0) {
            std::cerr << "binarychain: " << file << ": decode error after "
                      << total << " bytes: " << bchain_strerror (errno)
                      << std::endl;
            return 1;
        }
    }

    if (total == 0) {
        std::cout << "Empty input, no chains" << std::endl;
        return 0;
    }
    if (decoder.finish () != 0) {
        std::cerr << "binarychain: " << file << ": "
                  << bchain_strerror (errno) << " after " << chains
                  << " complete chains" << std::endl;
        return 1;
    }
    std::cout << chains << " chains, " << total << " bytes" << std::endl;
    return 0;
}

int cmd_view (const std::vector<std::string> &args_)
{
    if (args_.size () != 1) {
        usage ();
        return 2;
    }
    std::vector<unsigned char> content;
    if (read_file (args_[0], content) == -1) {
        print_error ("cannot read", args_[0]);
        return 1;
    }
    std::cout << args_[0] << ", " << content.size () << " bytes\n";
    if (!content.empty ())
        dump (&content[0], content.size ());
    return 0;
}
}

int main (int argc, char **argv)
{
    if (argc < 2) {
        usage ();
        return 2;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args (argv + 2, argv + argc);

    if (command == "encode")
        return cmd_encode (args);
    if (command == "decode")
        return cmd_decode (args);
    if (command == "view")
        return cmd_view (args);

    usage ();
    return 2;
}
