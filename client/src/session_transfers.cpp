#include "dropdeck/client/session.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "dropdeck/crypto.hpp"
#include "dropdeck/encoding/base64.hpp"
#include "dropdeck/error_codes.hpp"
#include "dropdeck/protocol.hpp"

namespace dropdeck::client
{

    namespace
    {

        constexpr int kMaxCompleteAttempts = 3;
        constexpr std::chrono::milliseconds kCompleteRetryDelay{250};

        std::string guess_mime(const std::filesystem::path &path)
        {
            auto extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            if (extension == ".png")
                return "image/png";
            if (extension == ".jpg" || extension == ".jpeg")
                return "image/jpeg";
            if (extension == ".gif")
                return "image/gif";
            if (extension == ".webp")
                return "image/webp";
            if (extension == ".svg")
                return "image/svg+xml";
            if (extension == ".txt" || extension == ".log" || extension == ".md")
                return "text/plain";
            if (extension == ".json")
                return "application/json";
            if (extension == ".pdf")
                return "application/pdf";
            if (extension == ".zip")
                return "application/zip";
            if (extension == ".mp4")
                return "video/mp4";
            if (extension == ".mp3")
                return "audio/mpeg";
            return "application/octet-stream";
        }

        // Same file, same size, same modification time: the server may resume the previous session.
        std::string make_file_key(const std::filesystem::path &path, std::uint64_t size)
        {
            const auto mtime = std::filesystem::last_write_time(path).time_since_epoch().count();
            return path.filename().string() + ":" + std::to_string(size) + ":" + std::to_string(mtime);
        }

    } // namespace

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: UPLOAD <local_path>" << std::endl;
            return true;
        }
        return perform_upload(std::filesystem::path(args[0]));
    }

    bool ClientSession::handle_fetch(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: FETCH <name> [local_path]" << std::endl;
            return true;
        }
        std::string name = args[0];
        constexpr std::string_view kUrlPrefix = "/file/";
        if (name.starts_with(kUrlPrefix))
        {
            name = name.substr(kUrlPrefix.size());
        }
        const std::filesystem::path local_target = args.size() == 2 ? std::filesystem::path(args[1])
                                                                    : std::filesystem::path(name);
        return perform_download(name, local_target);
    }

    bool ClientSession::perform_upload(const std::filesystem::path &local_path_input)
    {
        const auto absolute_local = std::filesystem::absolute(local_path_input);
        if (!std::filesystem::exists(absolute_local))
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            std::cout << "Local file does not exist." << std::endl;
            return true;
        }
        if (!std::filesystem::is_regular_file(absolute_local))
        {
            std::cout << "ERROR: invalid_target" << std::endl;
            std::cout << "Local path is not a file." << std::endl;
            return true;
        }

        const auto file_size = std::filesystem::file_size(absolute_local);
        const dropdeck::protocol::UploadInitRequest init{
            .file_name = absolute_local.filename().string(),
            .size = file_size,
            .mime = guess_mime(absolute_local),
            .file_key = make_file_key(absolute_local, file_size),
            .chunk_size = config_.chunk_size,
        };

        auto init_response = rpc(dropdeck::protocol::Command::UploadInit, init);
        if (init_response.kind == dropdeck::protocol::ResponseKind::Error)
        {
            print_error(init_response);
            return true;
        }
        const auto session = init_response.payload.get<dropdeck::protocol::UploadInitResponse>();
        const std::set<std::uint64_t> already(session.uploaded.begin(), session.uploaded.end());
        if (!already.empty())
        {
            std::cout << "Resuming upload, " << already.size() << " of " << session.total_chunks
                      << " chunk(s) already on the server" << std::endl;
        }
        logger_.log(LogTag::Upload, "init id=", session.upload_id, " chunks=", session.total_chunks,
                    " resumed=", already.size());

        std::ifstream in(absolute_local, std::ios::binary);
        if (!in.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Could not open local file for reading." << std::endl;
            return true;
        }

        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            if (already.contains(index))
            {
                continue;
            }
            if (!send_chunk(in, session.upload_id, index, session.chunk_size, file_size))
            {
                std::cout << std::endl;
                return true;
            }
            std::cout << "\rUploaded chunk " << (index + 1) << " / " << session.total_chunks << std::flush;
        }
        if (session.total_chunks > 0)
        {
            std::cout << std::endl;
        }

        for (int attempt = 0; attempt < kMaxCompleteAttempts; ++attempt)
        {
            auto complete_response = rpc(dropdeck::protocol::Command::UploadComplete,
                                         dropdeck::protocol::UploadCompleteRequest{.upload_id = session.upload_id});
            if (complete_response.kind == dropdeck::protocol::ResponseKind::Ok)
            {
                print_item(complete_response.payload.get<dropdeck::TransferItem>());
                return true;
            }
            if (!complete_response.payload.contains("missingChunk"))
            {
                if (!dropdeck::is_retryable(complete_response.error))
                {
                    print_error(complete_response);
                    return true;
                }
                // The chunks stay on the server; ask again after a pause.
                logger_.warn(LogTag::Upload, "complete id=", session.upload_id, " retrying after ",
                             dropdeck::to_string(complete_response.error), ": ", complete_response.message);
                std::this_thread::sleep_for(kCompleteRetryDelay * (attempt + 1));
                continue;
            }
            const auto missing = complete_response.payload.at("missingChunk").get<std::uint64_t>();
            std::cout << "Server is missing chunk " << missing << ", resending" << std::endl;
            if (!send_chunk(in, session.upload_id, missing, session.chunk_size, file_size))
            {
                return true;
            }
        }
        std::cout << "ERROR: upload_incomplete" << std::endl;
        std::cout << "Upload could not be completed, run UPLOAD again to resume." << std::endl;
        return true;
    }

    bool ClientSession::send_chunk(std::ifstream &in, const std::string &upload_id, std::uint64_t index,
                                   std::uint64_t chunk_size, std::uint64_t file_size)
    {
        const auto offset = index * chunk_size;
        const auto length = static_cast<std::size_t>(std::min(chunk_size, file_size - offset));
        std::vector<char> buffer(length);
        in.clear();
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (static_cast<std::size_t>(in.gcount()) != length)
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Local file changed during upload." << std::endl;
            return false;
        }

        const dropdeck::protocol::UploadChunkRequest chunk{
            .upload_id = upload_id,
            .index = index,
            .data_base64 = dropdeck::encoding::encode_base64(std::as_bytes(std::span(buffer.data(), buffer.size()))),
        };
        auto response = rpc(dropdeck::protocol::Command::UploadChunk, chunk);
        if (response.kind == dropdeck::protocol::ResponseKind::Error)
        {
            print_error(response);
            return false;
        }
        return true;
    }

    bool ClientSession::perform_download(const std::string &file_name, const std::filesystem::path &local_target_input)
    {
        const auto absolute_local = std::filesystem::absolute(local_target_input);
        if (std::filesystem::exists(absolute_local))
        {
            std::cout << "ERROR: file_exists" << std::endl;
            std::cout << "Local file already exists." << std::endl;
            return true;
        }

        auto part_path = absolute_local;
        part_path += ".part";
        std::uint64_t existing_bytes = 0;
        if (std::filesystem::exists(part_path))
        {
            existing_bytes = std::filesystem::file_size(part_path);
        }

        auto init_response = rpc(dropdeck::protocol::Command::DownloadInit,
                                 dropdeck::protocol::DownloadInitRequest{.file_name = file_name});
        if (init_response.kind == dropdeck::protocol::ResponseKind::Error)
        {
            print_error(init_response);
            return true;
        }

        const auto descriptor = init_response.payload.at("descriptor").get<dropdeck::protocol::TransferDescriptor>();
        if (existing_bytes > descriptor.total_size)
        {
            // A stale partial download of a different file; start over.
            existing_bytes = 0;
        }

        std::fstream part(part_path, std::ios::binary | std::ios::in | std::ios::out);
        if (!part.is_open() || existing_bytes == 0)
        {
            part.close();
            part.open(part_path, std::ios::binary | std::ios::out | std::ios::trunc);
            part.close();
            part.open(part_path, std::ios::binary | std::ios::in | std::ios::out);
        }
        if (!part.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to open partial file for writing." << std::endl;
            return true;
        }

        std::uint64_t offset = existing_bytes;
        if (offset > 0)
        {
            std::cout << "Resuming download from byte " << offset << std::endl;
        }

        while (offset < descriptor.total_size)
        {
            const dropdeck::protocol::DownloadChunkRequest chunk_request{
                .transfer_id = descriptor.transfer_id,
                .offset = offset,
                .max_bytes = descriptor.chunk_size,
            };
            auto chunk_response = rpc(dropdeck::protocol::Command::DownloadChunk, chunk_request);
            if (chunk_response.kind == dropdeck::protocol::ResponseKind::Error)
            {
                std::cout << std::endl;
                print_error(chunk_response);
                return true;
            }
            const auto payload = chunk_response.payload.get<dropdeck::protocol::DownloadChunkResponse>();
            const auto data = dropdeck::encoding::decode_base64(payload.data_base64);
            if (!data || data->size() != static_cast<std::size_t>(payload.bytes) || (payload.bytes == 0 && !payload.done))
            {
                std::cout << std::endl;
                std::cout << "ERROR: invalid_response" << std::endl;
                return true;
            }
            if (!payload.chunk_hash.empty() && dropdeck::crypto::hash_bytes(*data) != payload.chunk_hash)
            {
                std::cout << std::endl;
                std::cout << "ERROR: hash_mismatch" << std::endl;
                std::cout << "Chunk hash verification failed." << std::endl;
                return true;
            }
            part.seekp(static_cast<std::streamoff>(offset));
            part.write(reinterpret_cast<const char *>(data->data()), static_cast<std::streamsize>(data->size()));
            if (!part)
            {
                std::cout << std::endl;
                std::cout << "ERROR: file_io" << std::endl;
                std::cout << "Failed to write to partial file." << std::endl;
                return true;
            }
            offset += data->size();
            std::cout << "\rDownloaded " << offset << " / " << descriptor.total_size << " bytes" << std::flush;
            if (payload.done)
            {
                break;
            }
        }
        std::cout << std::endl;
        part.close();

        if (offset != descriptor.total_size)
        {
            std::cout << "ERROR: download_incomplete" << std::endl;
            std::cout << "Download interrupted before completion." << std::endl;
            return true;
        }

        if (descriptor.hash && dropdeck::crypto::hash_file(part_path) != *descriptor.hash)
        {
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
            std::cout << "ERROR: hash_mismatch" << std::endl;
            std::cout << "File hash verification failed." << std::endl;
            return true;
        }

        std::error_code ec;
        std::filesystem::rename(part_path, absolute_local, ec);
        if (ec)
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to finalize downloaded file: " << ec.message() << std::endl;
            return true;
        }

        logger_.log(LogTag::Download, "saved ", file_name, " to ", absolute_local.string());
        std::cout << "OK" << std::endl;
        return true;
    }

} // namespace dropdeck::client
