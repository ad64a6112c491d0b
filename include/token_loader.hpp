/**
 * @file token_loader.hpp
 * @brief GitHub token file loader.
 */
#ifndef GHDIGEST_TOKEN_LOADER_HPP
#define GHDIGEST_TOKEN_LOADER_HPP

#include <string>
#include <vector>

namespace ghd {

/**
 * Load GitHub access tokens from a file.
 *
 * JSON, YAML, and TOML files (chosen by extension) may contain a flat array
 * of tokens or an object/table with either a single `token` string or a
 * `tokens` array of strings. Any other file is read as plain text holding
 * one token per non-empty line.
 *
 * @param path Filesystem path to the token file
 * @return Tokens discovered in the file, in file order
 * @throws std::runtime_error on read or parse errors
 */
std::vector<std::string> load_tokens_from_file(const std::string &path);

} // namespace ghd

#endif // GHDIGEST_TOKEN_LOADER_HPP
