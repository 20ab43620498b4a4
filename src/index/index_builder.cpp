#include "index/index_builder.hpp"
#include "index/vbi_writer.hpp"
#include "io/variant_reader.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>

namespace vbi {

bool build_index(const IndexBuilderConfig& config, const Logger& logger, Error* err) {
    auto t0 = std::chrono::steady_clock::now();

    VariantReader reader;
    Error open_err;
    if (!reader.open(config.source_path, config.threads, &open_err)) {
        logger.error("%s", open_err.message.c_str());
        return fail(err, open_err.kind, open_err.message);
    }

    logger.debug("Source: %s (%s offsets, threads=%d)", config.source_path.c_str(),
                 offset_codec_name(reader.codec()), config.threads);

    VbiWriter writer;
    writer.set_num_samples(reader.num_samples());
    writer.set_codec(reader.codec());

    BcfRecord rec;
    if (!rec.valid()) {
        return fail(err, ErrorKind::kIo, "cannot allocate VCF record");
    }

    uint64_t next_report = 1000000;
    for (;;) {
        int64_t offset = reader.tell();
        if (offset < 0) {
            std::string msg = "cannot determine offset in '" + config.source_path + "'";
            logger.error("%s", msg.c_str());
            return fail(err, ErrorKind::kIo, msg);
        }

        int ret = reader.read(rec.get());
        if (ret == 0) break;
        if (ret < 0) {
            std::string msg = "read error in '" + config.source_path + "' after " +
                              std::to_string(writer.num_markers()) + " records";
            logger.error("%s", msg.c_str());
            return fail(err, ErrorKind::kIo, msg);
        }

        writer.add_marker(reader.chrom_name(rec.get()),
                          static_cast<GenomePos>(rec->pos) + 1, offset);

        if (config.verbose && writer.num_markers() >= next_report) {
            std::fprintf(stderr, "\r  Scanned %lu records",
                         static_cast<unsigned long>(writer.num_markers()));
            std::fflush(stderr);
            next_report += 1000000;
        }
    }
    if (config.verbose && writer.num_markers() >= 1000000) {
        std::fprintf(stderr, "\n");
    }
    reader.close();

    Error write_err;
    if (!writer.write(config.index_path, &write_err)) {
        logger.error("%s", write_err.message.c_str());
        return fail(err, write_err.kind, write_err.message);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    logger.info("Indexing finished: %ld samples, %lu markers, %u chromosomes",
                static_cast<long>(writer.num_samples()),
                static_cast<unsigned long>(writer.num_markers()),
                writer.num_chroms());
    logger.debug("Wrote %s in %ld ms", config.index_path.c_str(), static_cast<long>(elapsed));
    return true;
}

} // namespace vbi
