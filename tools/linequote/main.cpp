// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/cpp/error.hpp"
#include "lib/cpp/file.hpp"
#include "lib/cpp/flag.hpp"
#include "lib/cpp/log.hpp"
#include "lib/cpp/path.hpp"
#include "lib/cpp/utf8.hpp"
#include "lib/linequote/lines.hpp"
#include "lib/linequote/quote.hpp"
#include "lib/linequote/style.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <signal.h>

#ifndef LINEQUOTE_VERSION
#define LINEQUOTE_VERSION "unknown"
#endif

namespace linequote {
namespace {

std::string_view ProgramName = "linequote";

class StyleFlag : public flag::FlagBase {
    Style *m_ptr;

public:
    explicit StyleFlag(Style *ptr) : m_ptr{ptr} {}

    flag::FlagArgument Argument() const override {
        return flag::FlagArgument::Required;
    }

    void Parse(std::optional<std::string_view> arg) override {
        if (!arg.has_value()) {
            throw flag::UsageError("missing quoting style");
        }
        std::optional<Style> style = LookupStyle(*arg);
        if (!style.has_value()) {
            std::string msg =
                fmt::format("{} is not a valid quoting style (valid: {})",
                            QuoteC(*arg), fmt::join(StyleNames(), ","));
            throw flag::UsageError(msg);
        }
        *m_ptr = *style;
    }
};

// Reads delimited records from a file. Each record must be valid UTF-8.
class FileLineSource : public LineSource {
    util::InputFile *m_file;
    char m_delimiter;

public:
    FileLineSource(util::InputFile *file, char delimiter)
        : m_file{file}, m_delimiter{delimiter} {}

    bool Next(std::string *line) override {
        bool ok = m_delimiter == '\n' ? m_file->ReadLine(line)
                                      : m_file->ReadRecord(m_delimiter, line);
        if (!ok) {
            return false;
        }
        if (!util::IsValidUTF8(*line)) {
            throw util::InvalidUTF8(m_file->name());
        }
        return true;
    }
};

[[noreturn]] void FailUsage(std::string_view msg) {
    util::Err("{}", msg);
    fmt::print(stderr, "Try '{} -help' for more information.\n", ProgramName);
    std::exit(2);
}

void Help(FILE *fp, flag::Parser &fl) {
    fmt::print(fp,
               "Usage: {} [options] [FILE]...\n"
               "Quote the lines of FILE according to a quoting style.\n"
               "\n"
               "If FILE is absent, or if FILE is '-', read standard input.\n"
               "\n"
               "Options:\n",
               ProgramName);
    fl.OptionHelp(fp);
    std::fputs("\nQuoting styles:\n", fp);
    std::size_t width = 0;
    for (std::string_view name : StyleNames()) {
        width = std::max(width, name.size());
    }
    for (std::string_view name : StyleNames()) {
        std::optional<Style> style = LookupStyle(name);
        fmt::print(fp, "  {:<{}}  {}\n", name, width, StyleHelp(*style));
    }
}

struct Args {
    Style style;
    bool null;
    bool version;
    CSVOptions csv;
    std::vector<std::string> files;
};

Args ParseArgs(int argc, char **argv) {
    Args args{};
    args.style = Style::Literal;
    flag::Parser fl;
    fl.SetHelp(Help);
    fl.AddFlag(StyleFlag(&args.style), "quoting-style",
               "quote lines with STYLE (default: literal)", "STYLE");
    fl.AddAlias("q", "quoting-style");
    fl.AddBoolFlag(&args.null, "null",
                   "use NUL instead of newline as the line delimiter");
    fl.AddAlias("0", "null");
    fl.AddFlag(flag::String(&args.csv.field_separator), "field-separator",
               "field separator for the csv style (default: ',')", "SEP");
    fl.AddFlag(flag::String(&args.csv.record_separator), "record-separator",
               "record separator for the csv style (default: newline)",
               "SEP");
    fl.AddFlag(flag::SetValue<bool>(&args.version, true), "version",
               "print the version information and exit");
    fl.AddAlias("V", "version");
    fl.AddPositional(flag::StringList(&args.files),
                     flag::PositionalType::ZeroOrMore, "FILE",
                     "input files");
    flag::ProgramArguments prog_args{argc - 1, argv + 1};
    try {
        fl.ParseAll(prog_args);
    } catch (flag::UsageError &ex) { FailUsage(ex.what()); }
    if (args.csv.field_separator.empty()) {
        FailUsage("field separator must not be empty");
    }
    if (args.csv.record_separator.empty()) {
        FailUsage("record separator must not be empty");
    }
    if (args.style != Style::CSV) {
        const CSVOptions defaults;
        if (args.csv.field_separator != defaults.field_separator ||
            args.csv.record_separator != defaults.record_separator) {
            util::Warn("CSV separators are ignored by quoting style {}",
                       StyleName(args.style));
        }
    }
    if (args.files.empty()) {
        args.files.emplace_back("-");
    }
    return args;
}

// Set when SIGINT or SIGTERM arrives. The handler is installed without
// SA_RESTART, so a blocked read fails with EINTR.
volatile std::sig_atomic_t Interrupted = 0;

void HandleSignal(int signum) {
    (void)signum;
    Interrupted = 1;
}

void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void QuoteFile(const std::string &name, const LineQuoter &quoter,
               char delimiter, util::OutputFile *out) {
    util::InputFile in;
    in.Open(name);
    FileLineSource source{&in, delimiter};
    QuotedLines lines{quoter, &source};
    std::string line;
    while (!Interrupted && lines.Next(&line)) {
        out->Write(line);
        out->Put(delimiter);
    }
    in.Close();
}

int Main(int argc, char **argv) {
    if (argc > 0) {
        ProgramName = util::Basename(argv[0]);
    }
    Args args = ParseArgs(argc, argv);
    if (args.version) {
        fmt::print("{} {}\n", ProgramName, LINEQUOTE_VERSION);
        return 0;
    }

    InstallSignalHandlers();

    const char delimiter = args.null ? '\0' : '\n';
    const LineQuoter quoter{args.style, args.csv};
    util::OutputFile out;
    out.Create("-");
    // An interrupted run keeps the records already written and exits with
    // status 0.
    try {
        for (const std::string &name : args.files) {
            if (Interrupted) {
                break;
            }
            QuoteFile(name, quoter, delimiter, &out);
        }
    } catch (util::Error &) {
        if (!Interrupted) {
            throw;
        }
    }
    out.Commit();
    return 0;
}

} // namespace
} // namespace linequote

int main(int argc, char **argv) {
    try {
        return linequote::Main(argc, argv);
    } catch (util::Error &e) {
        util::Err("{}", e.what());
        return 1;
    }
}
