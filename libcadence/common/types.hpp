#pragma once

// Contains typedefs for the entire project

#include <array>
#include <cstdint>
#include <string>
#include <vector>

//[ Int types ]//
using i32  = std::int32_t;
using i64  = std::int64_t;
using uint = unsigned int;
using ui8  = std::uint8_t;
using ui32 = std::uint32_t;
using ui64 = std::uint64_t;

//[ NETWORKING DEFS ]//
using HostName    = std::string;       // Host part of the tracker URL
using PortStr     = std::string;       // Port number kept as a string for the resolver
using NetTarget   = const std::string; // Requested target (path + query) on the tracker
using NetResponse = std::string;       // Raw response body
using ApiKey      = std::string;       // Tracker API key (sent as the Authorization header)

//[ DIRECTORY AND PATHS DEFS ]//
using Directory = std::string; // Directory represented as a string
using RelPath   = std::string; // Relative Path as a string (need not be of a file)
using AbsPath   = std::string; // Absolute Path as a string (need not be of a file)
using FileName =
  std::string; // Just the filename as a string (only use this when it is just a file name)
using SubPath = std::string; // Path of a transcode output relative to the output directory

// NOTE: RelPath has the leisure of storing EVEN the absolute path, but NOT vice-versa!

//[ TRACKER DEFS ]//
using TorrentID = i64; // Tracker-assigned torrent identifier

//[ TORRENT DESCRIPTOR DEFS ]//
using TorrentByte                   = ui8;
using TorrentBuffer                 = std::vector<TorrentByte>; // Raw .torrent file contents
using PieceIdx                      = std::size_t;
using ByteCount                     = std::size_t;
inline constexpr ByteCount SHA1Size = 20;
using Sha1Digest                    = std::array<ui8, SHA1Size>;

//[ AUDIO STREAM DEFS ]//
using SampleRate         = int;
using BitDepth           = int;
using ChannelCount       = int;
using SampleCount        = i64;
using AudioStreamIdx     = int;
using AudioStreamIdxIter = uint;
