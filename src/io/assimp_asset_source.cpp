/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/assimp_asset_source.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <array>
#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>
#include <glm/gtc/type_ptr.hpp>
#include <unordered_map>

namespace bim::io {

    using core::Material;
    using core::MeshData;

    constexpr std::array ASSET_EXTENSIONS = {".obj", ".fbx", ".gltf", ".glb", ".stl", ".dae", ".3ds", ".ply"};

    // Self-contained formats are decoded from the in-memory buffer, the rest
    // may reference sidecar files (.mtl, .bin) and are read by path
    constexpr std::array MEMORY_DECODABLE = {".glb", ".stl", ".ply"};

    constexpr unsigned int IMPORT_FLAGS =
        aiProcess_Triangulate |
        aiProcess_JoinIdenticalVertices |
        aiProcess_GenSmoothNormals |
        aiProcess_SortByPType;

    // Keys under which exporters store an element's global id in node metadata
    constexpr std::array GUID_METADATA_KEYS = {"ifcGuid", "IfcGuid", "GlobalId", "guid"};

    namespace {

        std::string lower_extension(const std::filesystem::path& path) {
            auto ext = path.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        std::shared_ptr<Material> extract_material(const aiMaterial* ai_mat) {
            auto mat = std::make_shared<Material>();

            aiColor4D color;
            if (ai_mat->Get(AI_MATKEY_BASE_COLOR, color) == AI_SUCCESS ||
                ai_mat->Get(AI_MATKEY_COLOR_DIFFUSE, color) == AI_SUCCESS) {
                mat->base_color = {color.r, color.g, color.b, color.a};
            }

            aiColor3D emissive;
            if (ai_mat->Get(AI_MATKEY_COLOR_EMISSIVE, emissive) == AI_SUCCESS) {
                mat->emissive = {emissive.r, emissive.g, emissive.b};
            }

            ai_mat->Get(AI_MATKEY_METALLIC_FACTOR, mat->metallic);
            ai_mat->Get(AI_MATKEY_ROUGHNESS_FACTOR, mat->roughness);

            int two_sided = 0;
            if (ai_mat->Get(AI_MATKEY_TWOSIDED, two_sided) == AI_SUCCESS) {
                mat->double_sided = (two_sided != 0);
            }

            aiString ai_name;
            if (ai_mat->Get(AI_MATKEY_NAME, ai_name) == AI_SUCCESS) {
                mat->name = ai_name.C_Str();
            }

            return mat;
        }

        std::shared_ptr<MeshData> convert_ai_mesh(const aiMesh* ai_mesh) {
            auto mesh = std::make_shared<MeshData>();

            const unsigned int nv = ai_mesh->mNumVertices;
            mesh->vertices.reserve(nv);
            for (unsigned int i = 0; i < nv; ++i) {
                const auto& v = ai_mesh->mVertices[i];
                mesh->vertices.emplace_back(v.x, v.y, v.z);
            }

            const unsigned int nf = ai_mesh->mNumFaces;
            mesh->indices.reserve(nf);
            for (unsigned int i = 0; i < nf; ++i) {
                const auto& face = ai_mesh->mFaces[i];
                if (face.mNumIndices != 3)
                    continue;
                mesh->indices.emplace_back(face.mIndices[0], face.mIndices[1], face.mIndices[2]);
            }
            if (mesh->indices.size() < nf) {
                LOG_WARN("Mesh '{}' has {} non-triangle faces (skipped), {} triangles kept",
                         ai_mesh->mName.C_Str(), nf - mesh->indices.size(), mesh->indices.size());
            }

            if (ai_mesh->HasNormals()) {
                mesh->normals.reserve(nv);
                for (unsigned int i = 0; i < nv; ++i) {
                    const auto& n = ai_mesh->mNormals[i];
                    mesh->normals.emplace_back(n.x, n.y, n.z);
                }
            }

            return mesh;
        }

        std::string read_node_guid(const aiNode* node) {
            if (!node->mMetaData)
                return {};

            for (const char* key : GUID_METADATA_KEYS) {
                aiString value;
                if (node->mMetaData->Get(key, value)) {
                    return value.C_Str();
                }
            }
            return {};
        }

        class NodeConverter {
        public:
            explicit NodeConverter(const aiScene* scene) : scene_(scene) {}

            ImportedNode convert(const aiNode* ai_node) {
                ImportedNode node;
                node.name = ai_node->mName.C_Str();
                node.source_guid = read_node_guid(ai_node);

                // aiMatrix4x4 is row-major, glm is column-major
                node.transform = glm::transpose(glm::make_mat4(&ai_node->mTransformation.a1));

                if (ai_node->mNumMeshes == 1) {
                    attachMesh(node, ai_node->mMeshes[0]);
                } else {
                    // Several meshes on one node become sibling leaves sharing its identity
                    for (unsigned int i = 0; i < ai_node->mNumMeshes; ++i) {
                        ImportedNode part;
                        part.name = node.name;
                        part.source_guid = node.source_guid;
                        attachMesh(part, ai_node->mMeshes[i]);
                        node.children.push_back(std::move(part));
                    }
                }

                node.children.reserve(node.children.size() + ai_node->mNumChildren);
                for (unsigned int i = 0; i < ai_node->mNumChildren; ++i) {
                    node.children.push_back(convert(ai_node->mChildren[i]));
                }
                return node;
            }

            [[nodiscard]] size_t meshCount() const { return meshes_.size(); }

        private:
            void attachMesh(ImportedNode& node, const unsigned int mesh_index) {
                const aiMesh* ai_mesh = scene_->mMeshes[mesh_index];

                auto mesh_it = meshes_.find(mesh_index);
                if (mesh_it == meshes_.end()) {
                    mesh_it = meshes_.emplace(mesh_index, convert_ai_mesh(ai_mesh)).first;
                }
                node.mesh = mesh_it->second;

                const unsigned int mat_index = ai_mesh->mMaterialIndex;
                if (mat_index < scene_->mNumMaterials) {
                    auto mat_it = materials_.find(mat_index);
                    if (mat_it == materials_.end()) {
                        mat_it = materials_.emplace(mat_index, extract_material(scene_->mMaterials[mat_index])).first;
                    }
                    node.material = mat_it->second;
                }
            }

            const aiScene* scene_;
            std::unordered_map<unsigned int, std::shared_ptr<MeshData>> meshes_;
            std::unordered_map<unsigned int, std::shared_ptr<Material>> materials_;
        };

    } // namespace

    Result<std::filesystem::path> resolve_local_url(const std::string& url) {
        constexpr std::string_view FILE_SCHEME = "file://";

        if (url.empty()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "Empty asset URL");
        }
        if (url.starts_with(FILE_SCHEME)) {
            return core::utf8_to_path(url.substr(FILE_SCHEME.size()));
        }
        if (url.find("://") != std::string::npos) {
            return make_error(ErrorCode::FETCH_FAILED, std::format("Unsupported URL scheme: {}", url));
        }
        return core::utf8_to_path(url);
    }

    bool is_supported_asset_extension(const std::filesystem::path& path) {
        const auto ext = lower_extension(path);
        return std::find(ASSET_EXTENSIONS.begin(), ASSET_EXTENSIONS.end(), ext) != ASSET_EXTENSIONS.end();
    }

    Result<std::shared_ptr<ImportedAsset>> import_with_assimp(
        const std::filesystem::path& path,
        const std::vector<uint8_t>* preloaded_bytes) {

        const auto start_time = std::chrono::high_resolution_clock::now();

        if (!is_supported_asset_extension(path)) {
            return make_error(ErrorCode::UNSUPPORTED_FORMAT,
                              std::format("Unsupported asset extension '{}'", path.extension().string()), path);
        }

        const auto ext = lower_extension(path);
        const bool from_memory = preloaded_bytes && !preloaded_bytes->empty() &&
                                 std::find(MEMORY_DECODABLE.begin(), MEMORY_DECODABLE.end(), ext) != MEMORY_DECODABLE.end();

        Assimp::Importer importer;
        const aiScene* ai_scene = nullptr;
        if (from_memory) {
            ai_scene = importer.ReadFileFromMemory(preloaded_bytes->data(), preloaded_bytes->size(),
                                                   IMPORT_FLAGS, ext.c_str() + 1);
        } else {
            if (!std::filesystem::exists(path)) {
                return make_error(ErrorCode::PATH_NOT_FOUND, "Asset file not found", path);
            }
            ai_scene = importer.ReadFile(core::path_to_utf8(path), IMPORT_FLAGS);
        }

        if (!ai_scene || (ai_scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !ai_scene->mRootNode) {
            return make_error(ErrorCode::DECODING_FAILED,
                              std::format("Assimp failed: {}", importer.GetErrorString()), path);
        }

        NodeConverter converter(ai_scene);
        auto asset = std::make_shared<ImportedAsset>();
        asset->source_url = core::path_to_utf8(path);
        asset->root = converter.convert(ai_scene->mRootNode);

        const auto mesh_nodes = asset->meshNodeCount();
        if (mesh_nodes == 0) {
            LOG_WARN("Asset '{}' contains no mesh nodes", core::path_to_utf8(path.filename()));
        }

        const auto load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);
        LOG_INFO("Imported '{}': {} meshes, {} mesh nodes in {}ms",
                 core::path_to_utf8(path.filename()), converter.meshCount(), mesh_nodes, load_time.count());

        return asset;
    }

    AssimpAssetSource::~AssimpAssetSource() {
        shutdown();
    }

    void AssimpAssetSource::enqueue(std::function<void()> event) {
        std::lock_guard lock(mutex_);
        pending_events_.push_back(std::move(event));
    }

    void AssimpAssetSource::fetch(const std::string& url,
                                  FetchProgressCallback on_progress,
                                  FetchCompleteCallback on_complete) {
        auto resolved = resolve_local_url(url);
        if (!resolved) {
            LOG_ERROR("Cannot fetch '{}': {}", url, resolved.error().format());
            enqueue([on_complete, error = resolved.error()] {
                if (on_complete)
                    on_complete(std::unexpected(error));
            });
            return;
        }

        LOG_DEBUG("Fetching asset '{}'", url);

        auto& job = jobs_.emplace_back();
        job.worker = std::jthread([this, &job, url, path = std::move(*resolved),
                                   on_progress = std::move(on_progress),
                                   on_complete = std::move(on_complete)](std::stop_token stop_token) {
            auto deliver = [&](Result<std::shared_ptr<ImportedAsset>> result) {
                enqueue([on_complete, result = std::move(result)] {
                    if (on_complete)
                        on_complete(result);
                });
            };

            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) {
                deliver(make_error(ErrorCode::PATH_NOT_FOUND, "Asset file not found", path));
                job.finished = true;
                return;
            }
            if (!std::filesystem::is_regular_file(path, ec)) {
                deliver(make_error(ErrorCode::NOT_A_FILE, "Asset path is not a file", path));
                job.finished = true;
                return;
            }

            const uint64_t total = std::filesystem::file_size(path, ec);
            std::ifstream file;
            if (ec || !core::open_file_for_read(path, file)) {
                deliver(make_error(ErrorCode::READ_FAILURE, "Cannot open asset file", path));
                job.finished = true;
                return;
            }

            std::vector<uint8_t> bytes;
            bytes.reserve(static_cast<size_t>(total));
            std::vector<char> chunk(READ_CHUNK_BYTES);
            uint64_t loaded = 0;
            while (file) {
                if (stop_token.stop_requested()) {
                    LOG_DEBUG("Fetch of '{}' stopped", url);
                    job.finished = true;
                    return;
                }
                file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                const auto got = static_cast<size_t>(file.gcount());
                if (got == 0)
                    break;
                bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));
                loaded += got;
                if (on_progress) {
                    enqueue([on_progress, progress = FetchProgress{loaded, total}] { on_progress(progress); });
                }
            }
            if (file.bad()) {
                deliver(make_error(ErrorCode::READ_FAILURE, "Error while reading asset file", path));
                job.finished = true;
                return;
            }

            auto result = import_with_assimp(path, &bytes);
            if (result) {
                (*result)->source_url = url;
            }
            if (!stop_token.stop_requested()) {
                deliver(std::move(result));
            }
            job.finished = true;
        });
    }

    size_t AssimpAssetSource::poll() {
        std::deque<std::function<void()>> events;
        {
            std::lock_guard lock(mutex_);
            events.swap(pending_events_);
        }

        for (auto& event : events) {
            event();
        }

        // Joining is immediate: a finished worker has already returned
        std::erase_if(jobs_, [](const Job& job) { return job.finished.load(); });

        return events.size();
    }

    bool AssimpAssetSource::hasPendingWork() const {
        {
            std::lock_guard lock(mutex_);
            if (!pending_events_.empty())
                return true;
        }
        return std::any_of(jobs_.begin(), jobs_.end(), [](const Job& job) { return !job.finished.load(); });
    }

    void AssimpAssetSource::shutdown() {
        for (auto& job : jobs_) {
            job.worker.request_stop();
        }
        jobs_.clear();

        std::lock_guard lock(mutex_);
        pending_events_.clear();
    }

} // namespace bim::io
