#include <tessera/files_content.hpp>
#include <tessera/digest.hpp>
#include <tessera/log.hpp>

namespace tessera {

Result<FilesContent> read_files_content(const DirectoryDigest& digest,
                                        const ContentStore& store,
                                        const CancelToken* cancel) {
    TESSERA_TRY_ASSIGN(auto records, DigestEngine::read_tree(digest, store));

    FilesContent contents;
    std::vector<std::string> missing;
    for (auto& rec : records) {
        if (!rec.path_stat.is_file()) continue;
        TESSERA_TRY(check_cancelled(cancel, "content read of " + digest.to_string()));

        if (rec.inlined) {
            contents.push_back(FileContent{rec.path_stat.path, std::move(rec.inline_content)});
            continue;
        }

        auto blob = store.load(rec.content_fingerprint);
        if (blob.is_ok()) {
            contents.push_back(FileContent{rec.path_stat.path, std::move(blob).value()});
        } else if (blob.error().code == TesseraError::ContentUnavailable) {
            missing.push_back(rec.path_stat.path);
        } else {
            return std::move(blob).error();
        }
    }

    if (!missing.empty()) {
        std::string paths;
        for (const auto& m : missing) {
            if (!paths.empty()) paths += ", ";
            paths += m;
        }
        log::debug("%zu blobs missing for %s", missing.size(), digest.to_string().c_str());
        return TesseraError(TesseraError::ContentUnavailable,
            "content missing from store for: " + paths,
            "the blobs were evicted or never stored; snapshot the tree again");
    }
    return Result<FilesContent>::ok(std::move(contents));
}

Result<FilesContent> read_files_content(const Snapshot& snapshot,
                                        const ContentStore& store,
                                        const CancelToken* cancel) {
    return read_files_content(snapshot.digest(), store, cancel);
}

Result<Snapshot> snapshot_for_digest(const DirectoryDigest& digest,
                                     const ContentStore& store) {
    return DigestEngine::decode(digest, store);
}

} // namespace tessera
