#include "chain/JsonlTransferInbox.hpp"
#include "audit/AuditCodec.hpp"
#include "ledger/Errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace yieldguard;
using json = nlohmann::json;

JsonlTransferInbox::JsonlTransferInbox(std::string path) : path_(std::move(path)) {}

std::vector<TransferEvent> JsonlTransferInbox::poll_new_transfers() {
    std::vector<TransferEvent> out;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return out;   // indexer hasn't written yet

    uint64_t size = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw CollaboratorUnavailable("[INBOX] Cannot stat " + path_ + ": " + ec.message());
    }
    if (size < offset_) {
        std::cout << "[INBOX] " << path_ << " shrank, re-reading from start\n";
        offset_ = 0;
    }
    if (size == offset_) return out;

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw CollaboratorUnavailable("[INBOX] Cannot open " + path_);
    }
    in.seekg(static_cast<std::streamoff>(offset_));
    std::string chunk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    size_t pos = 0;
    for (;;) {
        size_t nl = chunk.find('\n', pos);
        if (nl == std::string::npos) break;   // partial line: wait for the writer

        const uint64_t line_offset = offset_ + pos;
        std::string line = chunk.substr(pos, nl - pos);
        pos = nl + 1;
        if (line.empty() || line == "\r") continue;

        try {
            out.push_back(transfer_event_from_json(json::parse(line)));
        } catch (const std::exception& e) {
            std::cerr << "[INBOX] Skipping malformed line at offset "
                      << line_offset << ": " << e.what() << "\n";
        }
    }
    offset_ += pos;

    if (!out.empty()) {
        std::cout << "[INBOX] " << out.size() << " new transfer(s)\n";
    }
    return out;
}
