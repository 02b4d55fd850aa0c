#include <itermore/fn.hpp>
#include <boost/algorithm/string.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

/*
Reads an INI-style configuration, skips the banner before the first
[section] header, and prints the key/value entries of each section.

Sections with the same name that are not adjacent stay separate,
as grouper only groups adjacent runs.
*/
namespace fn = itermore::fn;
namespace ba = boost::algorithm;

using entry_t = std::tuple<std::string, std::string, std::string>; // section, key, value

static const char* s_sample_ini = R"(
    generated by confgen 2.1
    do not edit by hand

[server]
    host = example.org
    port = 8080
    ; the rest is tuned per deployment

[paths]
    root = /srv/www
    logs = /var/log/www
    cache

[server]
    workers = 4
)";

static bool IsHeader(const std::string& line)
{
    return ba::starts_with(line, "[") && ba::ends_with(line, "]");
}

static std::vector<entry_t> ParseEntries(std::istream& istr, std::ostream& log)
{
    using fn::operators::operator%;

    auto lines = fn::scanner(
        fn::seq([&istr]
        {
            std::string line;
            return std::getline(istr, line) ? ba::trim_copy(line) : fn::end_seq();
        })
      % fn::icompact()); // blank lines

    const size_t num_banner = lines.skip_until(IsHeader);
    log << "Skipped " << num_banner << " banner lines.\n";

    auto sections = lines.rest()
      % fn::where([](const std::string& line)
        {
            return !ba::starts_with(line, ";");
        })
      % fn::sectionize(IsHeader);

    std::vector<entry_t> entries;

    for(auto&& section : sections) {
        const auto name = ba::trim_copy_if(section.first, ba::is_any_of("[]"));

        for(auto&& line : section.second) {
            const auto pos = line.find('=');

            if(pos == std::string::npos) {
                log << "[" << name << "]: ignoring line without '=': " << line << "\n";
                continue;
            }

            entries.emplace_back(name,
                                 ba::trim_copy(line.substr(0, pos)),
                                 ba::trim_copy(line.substr(pos + 1)));
        }
    }

    return entries;
}

int main()
{
    using fn::operators::operator%;

    std::istringstream istr{ s_sample_ini };
    auto entries = ParseEntries(istr, std::cerr);

    entries
  % fn::grouper()
  % fn::for_each([](const auto& run) // run: (section, vec<(key, value)>)
    {
        std::cout << "[" << run.first << "]\n";
        for(const auto& kv : run.second) {
            std::cout << "    " << std::get<0>(kv) << " = " << std::get<1>(kv) << "\n";
        }
    });

    std::cout << "\nEntries per section:\n";
    for(const auto& kv : entries % fn::freq_by([](const entry_t& e) { return std::get<0>(e); })) {
        std::cout << "    " << kv.first << ": " << kv.second << "\n";
    }

    // keys are almost sorted within the file; a small window is enough
    std::cout << "\nKeys, approximately sorted:\n";
    std::move(entries)
  % fn::isort_by(3, [](const entry_t& e)
    {
        return std::get<1>(e);
    })
  % fn::for_each([](const entry_t& e)
    {
        std::cout << "    " << std::get<1>(e) << " (" << std::get<0>(e) << ")\n";
    });

    return 0;
}
