#include "iptcinfo/build_info.h"

#include "iptcinfo/build_info_generated.h"
#include "iptcinfo/iim_marker_scan.h"
#include "iptcinfo/iptc_dataset_registry.h"
#include "iptcinfo/iptc_record_decode.h"

namespace iptcinfo {
namespace {

    static BuildInfo make_build_info() noexcept
    {
        const IptcDatasetRegistry& registry = IptcDatasetRegistry::standard();

        BuildInfo bi;
        bi.version                  = IPTCINFO_BUILDINFO_VERSION;
        bi.build_type               = IPTCINFO_BUILDINFO_BUILD_TYPE;
        bi.linkage                  = IPTCINFO_BUILDINFO_LINKAGE;
        bi.compiler                 = IPTCINFO_BUILDINFO_COMPILER;
        bi.target                   = IPTCINFO_BUILDINFO_TARGET;
        bi.build_timestamp_utc      = IPTCINFO_BUILDINFO_BUILD_TIMESTAMP_UTC;
        bi.default_max_prefix_bytes = IimScanOptions {}.max_prefix_bytes;
        bi.default_max_datasets     = IptcRecordDecodeLimits {}.max_datasets;
        bi.scalar_datasets          = registry.scalars().size();
        bi.list_datasets            = registry.lists().size();
        return bi;
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    static const BuildInfo kBuildInfo = make_build_info();
    return kBuildInfo;
}


void
format_build_info(const BuildInfo& bi, std::string* out)
{
    if (!out) {
        return;
    }
    out->clear();
    out->append("IptcInfo ");
    out->append(bi.version);
    out->append(" (");
    out->append(bi.build_type.empty() ? std::string_view("unknown")
                                      : bi.build_type);
    out->append(", ");
    out->append(bi.linkage);
    out->append(")\n");

    out->append(bi.compiler);
    out->append(" for ");
    out->append(bi.target);
    if (!bi.build_timestamp_utc.empty()) {
        out->append(", built ");
        out->append(bi.build_timestamp_utc);
    }
    out->push_back('\n');

    out->append("record 2: ");
    out->append(std::to_string(bi.scalar_datasets));
    out->append(" scalar + ");
    out->append(std::to_string(bi.list_datasets));
    out->append(" list datasets, scan window ");
    out->append(std::to_string(bi.default_max_prefix_bytes));
    out->append(", max datasets ");
    out->append(std::to_string(bi.default_max_datasets));
    out->push_back('\n');
}

}  // namespace iptcinfo
