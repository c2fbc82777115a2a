// ---- STORE ----
// VideoStore Documentation
/*
DOCUMENTATION:
CLASS: VideoStore

VARIABLES:
. static constexpr const char* PAYLOAD_FILE = "video.mp4"
    - Name of the payload blob inside a slot
. static constexpr const char* METADATA_FILE = "videodata.txt"
    - Name of the title file inside a slot, doubles as commit marker
. static constexpr const char* PART_SUFFIX = ".part"
    - Suffix of the temporary file a write goes through
. static constexpr size_t BUFFER_SIZE = 64 * 1024
    - Chunk size for streaming payloads
. std::filesystem::path root_
    - Directory holding one slot directory per video

CONSTRUCTOR:
. explicit VideoStore(const std::filesystem::path& root)
    - Creates the root if it doesn't exist
    - Logs a warning if that fails, operations report the error later

METHODS:
Public:
  Core Storage:
  . void save(const std::string& id, const std::string& title, std::istream& payload)
      - Requires a slot reserved by IdAllocator
      - Streams payload into video.mp4, then writes title into videodata.txt
      - Each file goes through .part, fsync, rename, fsync of the slot
      - A re-save removes the old title before the new payload is renamed in
      - Throws WriteFailed; a failure after the payload commit leaves ORPHANED_PAYLOAD
  . std::string load(const std::string& id) const
      - Returns the title byte for byte
      - Throws NotFound for unknown, reserved or invalid ids
  . std::vector<Video> enumerate() const
      - Lists slots with readable metadata in directory order
      - Skips reserved and unreadable slots
      - Throws EnumerationFailed when the root can't be listed

  Payload Access:
  . std::filesystem::path payload_path(const std::string& id) const
      - Path of a committed payload, throws NotFound
  . std::uintmax_t read_payload(const std::string& id, std::ostream& output) const
      - Copies the payload in chunks, returns the byte count
      - Throws NotFound on a read error, WriteFailed if output fails
  . std::uintmax_t payload_size(const std::string& id) const
      - Size of the payload in bytes, throws NotFound

  Integrity Inspection:
  . SlotState inspect(const std::string& id) const
      - MISSING, RESERVED, COMPLETE, ORPHANED_PAYLOAD or MISSING_PAYLOAD
      - Never throws
  . Video verify(const std::string& id) const
      - Returns the video of a complete slot
      - Throws Corrupt for half-written slots, NotFound otherwise
  . std::vector<std::string> slots() const
      - Every slot directory name, complete or not

  Query Operations:
  . static bool is_valid_id(const std::string& id)
      - Rejects empty names, names starting with '.', and separators

Private:
  Durable Writes:
  . std::filesystem::path stage_file(const path& target, std::istream& source, uintmax_t& bytes) const
      - Writes target.part and fsyncs it, removes it on failure
  . void commit_file(const path& part, const path& target) const
      - Renames the part over target, fsyncs the directory
  . std::uintmax_t write_file(const std::filesystem::path& target, std::istream& source) const
      - stage_file then commit_file
  . void retract_metadata(const path& slot) const
      - Removes videodata.txt if present and fsyncs the slot
  Utility Methods:
  . void verify_committed(const std::string& id) const
      - Throws NotFound unless metadata and payload are regular files
*/

// IdAllocator Documentation
/*
DOCUMENTATION:
CLASS: IdAllocator

VARIABLES:
. static constexpr size_t ID_BYTES = 16
    - Random bytes per id, printed as 32 lowercase hex digits
. static constexpr int MAX_ATTEMPTS = 64
    - Collisions tolerated before giving up
. std::filesystem::path root_
    - Store root the slots are reserved under

CONSTRUCTOR:
. explicit IdAllocator(const std::filesystem::path& root)
    - Creates the root if it doesn't exist

METHODS:
Public:
  . std::string allocate() const
      - Draws a candidate with RAND_bytes and creates root/candidate exclusively
      - An existing directory means a collision, another candidate is drawn
      - Throws AllocationFailed on other mkdir errors or after MAX_ATTEMPTS
      - Safe across threads and processes, no locking
*/

// StoreError Documentation
/*
DOCUMENTATION:
CLASS: StoreError

VARIABLES:
. StoreErrc code_
    - ALLOCATION_FAILED, WRITE_FAILED, NOT_FOUND, ENUMERATION_FAILED or CORRUPT

CONSTRUCTOR:
. StoreError(StoreErrc code, const std::string& message)
    - Message is prefixed with the text of the code

DERIVED CLASSES:
. AllocationFailed, WriteFailed, NotFound, EnumerationFailed, Corrupt
    - One per error code, so callers can catch exactly what they handle
*/


// ---- WEB ----
// RequestHandler Documentation
/*
DOCUMENTATION:
CLASS: RequestHandler

VARIABLES:
. static constexpr size_t MAX_TITLE_BYTES = 64 * 1024
    - Largest title field read from an upload form
. store::VideoStore& store_
. store::IdAllocator& allocator_

METHODS:
Public:
  . static bool is_upload(const http::request_header<>& header)
      - True for POST /upload/, the session then spools the body to disk
  . Response handle(const http::request<http::string_body>& request)
      - GET /                       catalog, upload form, error banner from the query
      - GET /watch/{id}             player page, 303 to /?error=notfound&id= if unknown
      - GET /videos/{id}/video.mp4  payload as video/mp4, 404 if not committed
      - Other methods get 405, other paths 404, exceptions 500
  . StringResponse handle_upload(const http::request<Body>& request, const path& body_file)
      - Bad form or allocation failure: 303 to /?error=misc&msg=
      - Store failure while saving: 303 to /?error=fu
      - Success: 303 to /watch/{id}
Protected:
  . virtual StringResponse upload(content_type, body_file, version, keep_alive)
      - Decodes the spooled form, allocates a slot and saves the video
*/

// HttpServer Documentation
/*
DOCUMENTATION:
CLASS: HttpServer

VARIABLES:
. ServerSettings settings_
    - Address, port (0 for ephemeral), threads, spool directory, upload limit
. std::atomic<bool> is_running_
. uint16_t bound_port_
. std::vector<std::thread> io_threads_
. std::unique_ptr<net::io_context> io_context_
. std::unique_ptr<tcp::acceptor> acceptor_
. std::unique_ptr<net::thread_pool> upload_pool_
    - Runs allocate and save for uploads, joined on shutdown

CONSTRUCTOR:
. HttpServer(const ServerSettings& settings, RequestHandler& handler)
    - Throws invalid_argument for zero threads

METHODS:
Public:
  . bool start_listener()
      - Binds, listens and runs the io_context on settings.threads threads
      - Creates an upload thread_pool of the same size
      - Returns false if already running or the bind fails
  . void shutdown()
      - Closes the acceptor, stops the context and joins the threads
      - The server can be started again afterwards
  . uint16_t port() const
      - Port actually bound
*/

// HttpSession Documentation
/*
DOCUMENTATION:
CLASS: HttpSession

METHODS:
  . void run()
      - Reads the request header first
      - Uploads: body goes to a spool file under a body limit, 100-continue is answered
      - Upload handling runs on the server's upload thread_pool, the reply is posted back
      - Everything else: body read into memory, at most 64 KiB
      - Spool files are removed after the response or when the session dies
*/


// ---- CLI ----
// CLI Documentation
/*
DOCUMENTATION:
CLASS: CLI

METHODS:
  . void run()
      - Prompts with "LuTube> " until quit or end of input
      - ls, show <id>, upload <file> <title>, check <id>, fsck, help, quit
      - Errors are logged and printed, the loop keeps going
*/
