#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/ingest_client.h"

using namespace ingest::v1;
using ingest::client::IngestClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ingestctl <addr> upload <file> [--chunk-size bytes] [--overwrite|--no-overwrite] [--owner name] [--resume session_id]\n"
            << "  ingestctl <addr> status <session_id>\n"
            << "  ingestctl <addr> finalize <session_id>\n"
            << "  ingestctl <addr> abort <session_id>\n";
}

static void PrintStatus(const UploadStatus& status) {
  std::cout << "session_id=" << status.session_id() << "\n"
            << "state=" << UploadState_Name(status.state()) << "\n"
            << "total_length=" << status.total_length() << "\n"
            << "next_expected_offset=" << status.next_expected_offset() << "\n"
            << "received_bytes=" << status.received_bytes() << "\n"
            << "part_count=" << status.part_count() << "\n";
  if (!status.declared_name().empty()) {
    std::cout << "name=" << status.declared_name() << "\n";
  }
  if (!status.last_error().empty()) {
    std::cout << "last_error=" << status.last_error() << "\n";
  }
}

static void PrintEntry(const CatalogEntry& entry) {
  std::cout << "layer_id=" << entry.id() << "\n"
            << "layer_name=" << entry.key().layer_name() << "\n"
            << "storage_key=" << entry.storage_key() << "\n"
            << "byte_size=" << entry.byte_size() << "\n"
            << "min=" << entry.min_value() << " max=" << entry.max_value() << " mean=" << entry.global_average() << "\n";
}

static std::optional<uint64_t> ParseSize(const std::string& value) {
  try {
    size_t     consumed = 0;
    const auto parsed   = std::stoull(value, &consumed);
    if (consumed != value.size() || parsed == 0) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];
  std::string arg  = argv[3];

  IngestClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "upload") {
    IngestClient::UploadOptions options;
    std::string                 resume;
    for (int i = 4; i < argc; ++i) {
      const std::string flag = argv[i];
      if (flag == "--overwrite") {
        options.overwrite = true;
      } else if (flag == "--no-overwrite") {
        options.overwrite = false;
      } else if (flag == "--chunk-size" && i + 1 < argc) {
        auto size = ParseSize(argv[++i]);
        if (!size) {
          std::cerr << "invalid chunk size: " << argv[i] << "\n";
          return 1;
        }
        options.chunk_size = *size;
      } else if (flag == "--owner" && i + 1 < argc) {
        options.owner = argv[++i];
      } else if (flag == "--resume" && i + 1 < argc) {
        resume = argv[++i];
      } else {
        Usage();
        return 1;
      }
    }
    options.progress = [](uint64_t offset, uint64_t total) { std::cerr << "\rsent " << offset << "/" << total << std::flush; };

    auto result = client.UploadFile(arg, options, resume);
    std::cerr << "\n";
    if (!result.ok()) {
      std::cerr << "upload failed: " << result.status().ToString() << "\n";
      return 2;
    }
    std::cout << "session_id=" << result->session_id << "\n";
    PrintEntry(result->entry);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    auto status = client.GetUploadStatus(arg);
    if (!status.ok()) {
      std::cerr << "status failed: " << status.status().ToString() << "\n";
      return 2;
    }
    PrintStatus(*status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "finalize") {
    auto finalized = client.FinalizeUpload(arg);
    if (!finalized.ok()) {
      std::cerr << "finalize failed: " << finalized.status().ToString() << "\n";
      return 2;
    }
    PrintStatus(finalized->status());
    PrintEntry(finalized->entry());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "abort") {
    auto status = client.AbortUpload(arg);
    if (!status.ok()) {
      std::cerr << "abort failed: " << status.ToString() << "\n";
      return 2;
    }
    std::cout << "aborted " << arg << "\n";
    return 0;
  }

  Usage();
  return 1;
}
