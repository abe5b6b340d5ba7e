#pragma once
#include <ctime>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace epubkit {
namespace detail {

struct Node {
    bool directory = false;
    std::string data;
    std::time_t modified = 0;
};

// manifest 가 관리하는 파일이 옮겨지거나 지워질 때 알림을 받는다
class ResourceListener {
public:
    virtual ~ResourceListener() = default;
    // 삭제 직전 호출. FileError 를 던지면 삭제가 취소된다
    virtual void on_local_resource_removing(const std::string& path) = 0;
    virtual void on_local_resource_moved(const std::string& from, const std::string& to) = 0;
};

// 하나의 EpubFileSystem 이 소유하는 트리. 키는 정규화된 절대 경로 ("/", "/OEBPS/a.xhtml")
class FileSystemState {
public:
    FileSystemState();

    bool closed = false;
    std::map<std::string, Node> nodes;
    // 비어 있으면 아직 등록 전
    std::string package_document;
    std::set<std::string> local_resources;
    ResourceListener* listener = nullptr;

    // 닫혔으면 FileError(FileSystemClosed)
    void check_open(const std::string& path) const;

    const Node* find(const std::string& key) const;
    Node* find(const std::string& key);
    const Node& require(const std::string& key) const;
    Node& require(const std::string& key);

    std::vector<std::string> children(const std::string& key) const;
    bool has_children(const std::string& key) const;

    void create_file(const std::string& key, std::string data = {});
    void create_directory(const std::string& key);
    void create_directories(const std::string& key);
    void write(const std::string& key, const std::string& data, bool append);
    // 디렉토리는 비어 있어야 한다
    void remove(const std::string& key);
    // 하위 트리 전체를 옮긴다. to 는 존재하지 않아야 하고 부모 디렉토리는 있어야 한다
    void move(const std::string& from, const std::string& to);
    void copy_file(const std::string& from, const std::string& to);

    // mimetype, OPF, META-INF 제어 파일 (대소문자 무시)
    bool is_system_file(const std::string& key) const;
    // META-INF 와 OPF 가 있는 디렉토리
    bool is_base_directory(const std::string& key) const;
    bool is_local_resource(const std::string& key) const;

    static std::string parent_key(const std::string& key);
    static std::string name_of(const std::string& key);
    static std::string join_key(const std::string& parent, const std::string& name);
};

} // namespace detail
} // namespace epubkit
