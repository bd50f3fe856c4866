// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_RUNTIME_RUNTIME_API_HPP
#define NATIVE_SHARE_RUNTIME_RUNTIME_API_HPP

#include <cstddef>
#include <cstdint>

extern "C" {

struct NSRuntimeHandle;

enum NSErrorKind {
    NS_ERROR_NONE = 0,
    NS_ERROR_INVALID_ARGUMENT = 1,
    NS_ERROR_DECODING = 2,
    NS_ERROR_NAMING = 3,
    NS_ERROR_PATH_TRAVERSAL = 4,
    NS_ERROR_IO = 5,
    NS_ERROR_PRESENTATION = 6,
    NS_ERROR_MISSING_FILE = 7
};

enum NSShareStatus {
    NS_SHARE_COMPLETED = 0,
    NS_SHARE_CANCELLED = 1,
    NS_SHARE_ERROR = 2
};

enum NSShareItemKind {
    NS_ITEM_TEXT = 0,
    NS_ITEM_URL = 1,
    NS_ITEM_FILE = 2
};

struct NSShareItem {
    int32_t kind;            // NSShareItemKind
    const char* value;       // text, URL or absolute file path
    const char* mime_type;
};

// Called on the thread running ns_runtime_run_ui_tasks(). Pointers are only
// valid during the call. The host answers later (or immediately) with
// ns_runtime_complete_presentation(token, ...).
typedef void (*NSPresentCallback)(void* user_data,
                                  uint64_t token,
                                  const NSShareItem* items,
                                  std::size_t item_count,
                                  const char* title);

struct NSRuntimeOptions {
    const char* config_path;     // optional YAML configuration
    NSPresentCallback present;   // null: sharing is unavailable
    void* user_data;
};

struct NSSharedFile {
    const char* data;            // base64
    const char* name;
    const char* mime_type;       // optional
};

struct NSShareRequest {
    const char* text;            // optional
    const char* title;           // optional
    const char* url;             // optional
    const NSSharedFile* files;
    std::size_t file_count;
};

struct NSShareReport {
    bool success;
    int32_t error_kind;          // NSErrorKind
    const char* error_message;   // owned by the report, see ns_runtime_release_report
};

NSRuntimeHandle* ns_runtime_create(const NSRuntimeOptions* options);
void ns_runtime_destroy(NSRuntimeHandle* handle);

bool ns_runtime_can_share(NSRuntimeHandle* handle, const NSShareRequest* descriptor);

// The share calls block until the presentation has finished and staged files
// are released. Never call them from the thread that pumps UI tasks.
NSShareReport ns_runtime_share(NSRuntimeHandle* handle, const NSShareRequest* request);
NSShareReport ns_runtime_share_text(NSRuntimeHandle* handle, const char* text, const char* title);
NSShareReport ns_runtime_share_data(NSRuntimeHandle* handle,
                                    const char* data,
                                    const char* name,
                                    const char* title);
NSShareReport ns_runtime_share_file(NSRuntimeHandle* handle, const char* path, const char* title);
NSShareReport ns_runtime_cleanup(NSRuntimeHandle* handle);

// Runs queued UI tasks on the calling thread. Returns how many ran.
std::size_t ns_runtime_run_ui_tasks(NSRuntimeHandle* handle);

// Resolves a presentation. Returns false for unknown or already used tokens.
bool ns_runtime_complete_presentation(NSRuntimeHandle* handle,
                                      uint64_t token,
                                      int32_t status,
                                      const char* message);

// Valid until the handle is destroyed.
const char* ns_runtime_staging_directory(NSRuntimeHandle* handle);

void ns_runtime_release_report(NSRuntimeHandle* handle, NSShareReport* report);

}  // extern "C"

#endif  // NATIVE_SHARE_RUNTIME_RUNTIME_API_HPP
