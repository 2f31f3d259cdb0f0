// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_parser.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <fstream>
#include <typeinfo>
#include <utility>

#include <boost/any.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "htslib/hts.h"

#include "utils/path_utils.hpp"
#include "exceptions/user_error.hpp"
#include "config.hpp"
#include "option_collation.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace tiledown { namespace options {

namespace {

class CommandLineError : public UserError
{
public:
    CommandLineError(std::string why) : why_ {std::move(why)} {}
    
private:
    std::string why_;
    
    std::string do_where() const override { return "parse_options"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override
    {
        return "use the --help command to view required and allowable options";
    }
};

std::string quote_option(const std::string& name)
{
    return "'--" + po::strip_prefixes(name) + "'";
}

// Runs f, converting any program_options exception into a CommandLineError
template <typename F>
auto translate_errors(F&& f) -> decltype(f())
{
    try {
        return f();
    } catch (const po::required_option& e) {
        throw CommandLineError {"the command line option " + quote_option(e.get_option_name()) + " is required but is missing"};
    } catch (const po::unknown_option& e) {
        throw CommandLineError {"the option " + quote_option(e.get_option_name()) + " is not recognised"};
    } catch (const po::error& e) {
        throw CommandLineError {e.what()};
    }
}

template <typename T>
void reject(const std::string& option, const T& value, const std::string& reason)
{
    std::ostringstream ss {};
    ss << "the argument '" << value << "' given to option '--" << option << "' was rejected as it " << reason;
    throw CommandLineError {ss.str()};
}

po::options_description make_general_options()
{
    po::options_description general {"General"};
    general.add_options()
    ("help,h",
     "Report detailed option information")
    
    ("version",
     "Report detailed version information")
    
    ("config",
     po::value<fs::path>(),
     "Config file to populate command line options")
    
    ("debug",
     po::value<fs::path>()->implicit_value("tiledown_debug.log"),
     "Create log file for debugging")
    
    ("trace",
     po::value<fs::path>()->implicit_value("tiledown_trace.log"),
     "Create very verbose log file for debugging")
    
    ("working-directory,w",
     po::value<fs::path>(),
     "Sets the working directory")
    
    ("input,I",
     po::value<fs::path>()->required(),
     "SAM/BAM/CRAM file to downsample")
    
    ("output,O",
     po::value<fs::path>()->required(),
     "File to write kept reads to. The format follows the extension (.bam, .cram, otherwise SAM)")
    
    ("reference,R",
     po::value<fs::path>(),
     "FASTA reference genome, needed to read or write CRAM")
    ;
    return general;
}

po::options_description make_downsampling_options()
{
    po::options_description downsampling {"Downsampling"};
    downsampling.add_options()
    ("probability,P",
     po::value<double>()->default_value(1.0),
     "Approximate probability of keeping each read, in [0, 1]")
    
    ("stop-after",
     po::value<long long>()->default_value(0),
     "Only process the first N records of the input (0 processes all records)")
    
    ("allow-multiple-downsampling-despite-warnings",
     po::bool_switch()->default_value(false),
     "Downsample even if the input has already been downsampled by this program")
    
    ("remove-duplicate-information",
     po::value<bool>()->default_value(true),
     "Clear the duplicate flag of kept reads, as duplicate marking is invalidated by downsampling")
    
    ("read-name-regex",
     po::value<std::string>()->default_value("DEFAULT"),
     "Regular expression with three capture groups (tile, x, y) matching whole read names."
     " DEFAULT uses the standard Illumina layout, NONE keeps every read")
    
    ("position-histogram",
     po::value<fs::path>(),
     "Write per-tile histograms of the read x and y positions to this file")
    ;
    
    return downsampling;
}

void print_version(std::ostream& os)
{
    os << config::ProgramName << " version " << config::Version << '\n'
       << "Target: " << config::System.system_name << '\n'
       << "Compiler: " << config::System.compiler_name << ' ' << config::System.compiler_version << '\n'
       << "Boost: " << config::System.boost_version << '\n'
       << "htslib: " << hts_version() << std::endl;
}

void store_config_file(const fs::path& config_file, const po::options_description& descriptions, OptionMap& vm)
{
    std::ifstream config {config_file.string()};
    if (!config) {
        throw CommandLineError {"the config file " + config_file.string() + " given to option '--config' could not be opened"};
    }
    translate_errors([&] () { po::store(po::parse_config_file(config, descriptions), vm); });
}

void validate(const OptionMap& vm)
{
    if (vm.count("stop-after") == 1) {
        const auto value = vm.at("stop-after").as<long long>();
        if (value < 0) reject("stop-after", value, "must not be negative");
    }
    if (vm.count("probability") == 1) {
        const auto value = vm.at("probability").as<double>();
        if (!std::isfinite(value) || value < 0 || value > 1) {
            reject("probability", value, "must be between zero and one");
        }
    }
}

} // namespace

OptionMap parse_options(const int argc, const char** argv)
{
    const auto general = make_general_options();
    po::options_description all {"tiledown command line options"};
    all.add(general).add(make_downsampling_options());
    
    OptionMap preliminary {};
    translate_errors([&] () {
        po::store(po::command_line_parser(argc, argv).options(general).allow_unregistered().run(), preliminary);
    });
    if (preliminary.count("help") == 1) {
        std::cout << all << std::endl;
        return preliminary;
    }
    if (preliminary.count("version") == 1) {
        print_version(std::cout);
        return preliminary;
    }
    
    OptionMap result {};
    translate_errors([&] () { po::store(po::command_line_parser(argc, argv).options(all).run(), result); });
    // Stored after the command line so explicit arguments take precedence
    if (preliminary.count("config") == 1) {
        const auto config_file = resolve_path(preliminary.at("config").as<fs::path>(),
                                              get_working_directory(preliminary));
        store_config_file(config_file, all, result);
    }
    validate(result);
    translate_errors([&] () { po::notify(result); });
    return result;
}

namespace {

struct ValuePrinter
{
    std::ostream& os;
    
    template <typename T>
    bool print_if(const boost::any& value) const
    {
        if (value.type() != typeid(T)) return false;
        os << boost::any_cast<const T&>(value);
        return true;
    }
};

} // namespace

std::ostream& operator<<(std::ostream& os, const OptionMap& options)
{
    bool first {true};
    for (const auto& p : options) {
        if (!first) os << '\n';
        first = false;
        os << (p.second.defaulted() ? "  " : "* ") << p.first << '=';
        const auto& value = p.second.value();
        if (value.empty()) {
            os << "(empty)";
            continue;
        }
        if (value.type() == typeid(bool)) {
            os << (boost::any_cast<bool>(value) ? "yes" : "no");
        } else if (value.type() == typeid(fs::path)) {
            os << boost::any_cast<const fs::path&>(value).string();
        } else {
            const ValuePrinter printer {os};
            if (!(printer.print_if<long long>(value) || printer.print_if<double>(value) || printer.print_if<std::string>(value))) {
                os << "<" << value.type().name() << ">";
            }
        }
    }
    return os;
}

std::string to_string(const OptionMap& options)
{
    std::ostringstream ss {};
    ss << options;
    return ss.str();
}

} // namespace options
} // namespace tiledown
