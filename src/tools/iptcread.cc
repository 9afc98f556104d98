#include "iptcinfo/build_info.h"
#include "iptcinfo/byte_source.h"
#include "iptcinfo/console_format.h"
#include "iptcinfo/iptc_dataset_registry.h"
#include "iptcinfo/iptc_export.h"
#include "iptcinfo/iptc_read.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace iptcinfo {
namespace {

    enum class OutputMode : uint8_t {
        Text,
        Xml,
        Sql,
    };

    struct KeyValueArg final {
        std::string key;
        std::string value;
    };

    struct ToolOptions final {
        OutputMode mode = OutputMode::Text;
        std::string xml_root;
        std::string sql_table;
        std::vector<KeyValueArg> mappings;
        std::vector<KeyValueArg> extra;
        const char* output_path = nullptr;
        uint32_t max_bytes      = 256;
        bool verbose            = false;
        IptcReadOptions read;
    };

    static const char* stop_name(IptcRecordStop stop) noexcept
    {
        switch (stop) {
        case IptcRecordStop::EndOfData: return "end_of_data";
        case IptcRecordStop::EndOfRecord: return "end_of_record";
        case IptcRecordStop::TruncatedValue: return "truncated_value";
        case IptcRecordStop::LimitExceeded: return "limit_exceeded";
        case IptcRecordStop::InvalidRegistry: return "invalid_registry";
        }
        return "unknown";
    }

    static void append_text_report(const char* path, const IptcInfo& info,
                                   uint32_t max_bytes, std::string* out)
    {
        out->append("== ");
        out->append(path);
        out->push_back('\n');
        append_iptc_text_report(info, max_bytes, out);
    }

    static std::vector<IptcExportField>
    field_views(const std::vector<KeyValueArg>& args)
    {
        std::vector<IptcExportField> fields;
        fields.reserve(args.size());
        for (size_t i = 0; i < args.size(); ++i) {
            fields.push_back(IptcExportField { args[i].key, args[i].value });
        }
        return fields;
    }

    static std::vector<IptcSqlMapping>
    mapping_views(const std::vector<KeyValueArg>& args)
    {
        std::vector<IptcSqlMapping> mappings;
        mappings.reserve(args.size());
        for (size_t i = 0; i < args.size(); ++i) {
            mappings.push_back(IptcSqlMapping { args[i].key, args[i].value });
        }
        return mappings;
    }

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        if (v > 0xFFFFFFFFUL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    static bool parse_key_value_arg(const char* s, KeyValueArg* out)
    {
        if (!s) {
            return false;
        }
        const std::string_view arg(s);
        const size_t eq = arg.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return false;
        }
        out->key   = std::string(arg.substr(0, eq));
        out->value = std::string(arg.substr(eq + 1));
        return true;
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("options:\n");
        std::printf("  --xml                 print attributes as XML (several "
                    "files share a <photos> root)\n");
        std::printf(
            "  --xml-root NAME       XML root element (default: photo)\n");
        std::printf(
            "  --sql TABLE           print an INSERT statement for TABLE\n");
        std::printf(
            "  --map ATTR=COLUMN     map an IPTC attribute to a SQL column\n");
        std::printf(
            "  --extra KEY=VALUE     extra XML element / SQL column (repeatable)\n");
        std::printf(
            "  --max-prefix N        scan window in bytes (default: 512)\n");
        std::printf(
            "  --max-bytes N         max bytes to print per value (default: 256, 0 = all)\n");
        std::printf("  --output PATH         write output to PATH\n");
        std::printf("  --list-attributes     print the supported attributes\n");
        std::printf("  -v, --verbose         report scan/decode details on stderr\n");
        std::printf("  --version             print build information\n");
    }

    static void print_attributes()
    {
        const IptcDatasetRegistry& registry = IptcDatasetRegistry::standard();
        for (const IptcDatasetName& row : registry.scalars()) {
            std::printf("2:%03u %.*s\n", static_cast<unsigned>(row.dataset),
                        static_cast<int>(row.name.size()), row.name.data());
        }
        for (const IptcDatasetName& row : registry.lists()) {
            std::printf("2:%03u %.*s (list)\n",
                        static_cast<unsigned>(row.dataset),
                        static_cast<int>(row.name.size()), row.name.data());
        }
    }

    static void print_version()
    {
        std::string text;
        format_build_info(build_info(), &text);
        std::fputs(text.c_str(), stdout);
    }

    // Returns false when the file could not be opened or holds no IPTC.
    static bool read_file(const char* path, const ToolOptions& options,
                          IptcInfo* info)
    {
        FileByteSource source;
        if (source.open(path) != FileOpenStatus::Ok) {
            std::fprintf(stderr, "iptcread: failed to open `%s`\n", path);
            return false;
        }

        const IptcReadResult r = read_iptc_info(source, info, options.read);
        if (r.status != IptcReadStatus::Ok) {
            std::fprintf(stderr,
                         "iptcread: `%s`: no IPTC data in the first %u bytes\n",
                         path,
                         static_cast<unsigned>(
                             options.read.scan.max_prefix_bytes));
            return false;
        }
        if (options.verbose) {
            std::fprintf(stderr,
                         "iptcread: `%s`: record 2 at offset %llu, stored=%u "
                         "discarded=%u stop=%s\n",
                         path, static_cast<unsigned long long>(r.offset),
                         r.decode.datasets_stored, r.decode.datasets_discarded,
                         stop_name(r.decode.stop));
            if (r.decode.stop == IptcRecordStop::TruncatedValue) {
                std::fprintf(stderr,
                             "iptcread: `%s`: dataset 2:%03u truncated "
                             "(declared %u bytes)\n",
                             path,
                             static_cast<unsigned>(
                                 r.decode.last_header.dataset),
                             static_cast<unsigned>(
                                 r.decode.last_header.length));
            }
        }
        return true;
    }

    // Several files share one `<photos>` root so the output stays a single
    // XML document.
    static bool append_xml(const std::vector<IptcInfo>& infos,
                           bool collection, const ToolOptions& options,
                           std::string* out)
    {
        const std::vector<IptcExportField> extra = field_views(options.extra);
        IptcExportStatus status = IptcExportStatus::Ok;
        if (!collection && infos.size() == 1U) {
            status = export_iptc_xml(infos[0], options.xml_root, extra, out);
        } else {
            std::vector<IptcXmlEntry> entries;
            entries.reserve(infos.size());
            for (size_t i = 0; i < infos.size(); ++i) {
                entries.push_back(IptcXmlEntry { &infos[i], extra });
            }
            status = export_iptc_xml_collection(entries, {}, options.xml_root,
                                                out);
        }
        if (status != IptcExportStatus::Ok) {
            std::fprintf(stderr, "iptcread: invalid XML element name\n");
            return false;
        }
        return true;
    }

    static bool append_sql(const IptcInfo& info, const ToolOptions& options,
                           std::string* out)
    {
        const std::vector<IptcExportField> extra = field_views(options.extra);
        const std::vector<IptcSqlMapping> mappings = mapping_views(
            options.mappings);
        if (export_iptc_sql(info, options.sql_table, mappings, extra, out)
            != IptcExportStatus::Ok) {
            std::fprintf(stderr, "iptcread: invalid table, column or mapping\n");
            return false;
        }
        out->append(";\n");
        return true;
    }

}  // namespace
}  // namespace iptcinfo

int
main(int argc, char** argv)
{
    using namespace iptcinfo;

    ToolOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "--list-attributes") == 0) {
            print_attributes();
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            options.verbose = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--xml") == 0) {
            options.mode = OutputMode::Xml;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--xml-root") == 0 && i + 1 < argc) {
            options.xml_root = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--sql") == 0 && i + 1 < argc) {
            options.mode      = OutputMode::Sql;
            options.sql_table = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if ((std::strcmp(arg, "--map") == 0 || std::strcmp(arg, "--extra") == 0)
            && i + 1 < argc) {
            KeyValueArg kv;
            if (!parse_key_value_arg(argv[i + 1], &kv)) {
                std::fprintf(stderr, "invalid %s value `%s`\n", arg,
                             argv[i + 1]);
                return 2;
            }
            if (arg[2] == 'm') {
                options.mappings.push_back(kv);
            } else {
                options.extra.push_back(kv);
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-prefix") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-prefix value\n");
                return 2;
            }
            options.read.scan.max_prefix_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            options.max_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--output") == 0 && i + 1 < argc) {
            options.output_path = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }
    if (options.mode == OutputMode::Sql && options.mappings.empty()) {
        std::fprintf(stderr, "--sql requires at least one --map ATTR=COLUMN\n");
        return 2;
    }

    int exit_code = 0;
    std::string out;
    std::vector<IptcInfo> xml_infos;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }
        IptcInfo info;
        if (!read_file(path, options, &info)) {
            exit_code = 1;
            continue;
        }
        switch (options.mode) {
        case OutputMode::Text:
            append_text_report(path, info, options.max_bytes, &out);
            break;
        case OutputMode::Xml: xml_infos.push_back(std::move(info)); break;
        case OutputMode::Sql:
            if (!append_sql(info, options, &out)) {
                return 2;
            }
            break;
        }
    }
    if (options.mode == OutputMode::Xml && !xml_infos.empty()
        && !append_xml(xml_infos, argc - first_path > 1, options, &out)) {
        return 2;
    }

    if (options.output_path) {
        if (!write_text_file(options.output_path, out)) {
            std::fprintf(stderr, "iptcread: failed to write `%s`\n",
                         options.output_path);
            return 1;
        }
        return exit_code;
    }
    if (!out.empty()
        && std::fwrite(out.data(), 1, out.size(), stdout) != out.size()) {
        std::fprintf(stderr, "iptcread: failed to write output\n");
        return 1;
    }
    return exit_code;
}
