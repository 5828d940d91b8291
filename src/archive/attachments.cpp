#include "attachments.hpp"
#include "../util.hpp"

namespace onthisday {

std::string attachment_url(int64_t attachment_id) {
    return "/api/attachments/" + std::to_string(attachment_id);
}

std::string resolve_attachment_path(const std::string& filename) {
    return percent_decode(expand_home(filename));
}

std::string attachment_display_name(const std::optional<std::string>& transfer_name,
                                    const std::optional<std::string>& filename) {
    if (transfer_name && !transfer_name->empty()) return *transfer_name;
    if (filename && !filename->empty()) return *filename;
    return "attachment";
}

std::vector<Attachment> attachments_for_message(const Database& db, int64_t message_id) {
    auto stmt = db.prepare(
        "SELECT a.ROWID AS attachment_id, a.filename, a.mime_type, a.transfer_name "
        "FROM attachment a "
        "JOIN message_attachment_join maj ON maj.attachment_id = a.ROWID "
        "WHERE maj.message_id = ? "
        "ORDER BY a.ROWID;");
    stmt.bind(1, message_id);

    std::vector<Attachment> result;
    while (stmt.step()) {
        auto row = stmt.row();
        Attachment a;
        a.id = row.integer("attachment_id").value_or(0);
        a.filename = sanitize_text(
            attachment_display_name(row.text("transfer_name"), row.text("filename")));
        a.mime_type = row.text("mime_type");
        a.url = attachment_url(a.id);
        result.push_back(std::move(a));
    }
    return result;
}

std::optional<AttachmentFile> find_attachment_file(const Database& db, int64_t attachment_id) {
    auto stmt = db.prepare("SELECT filename, mime_type FROM attachment WHERE ROWID = ?;");
    stmt.bind(1, attachment_id);
    if (!stmt.step()) return std::nullopt;

    auto row = stmt.row();
    auto filename = row.text("filename");
    if (!filename || filename->empty()) return std::nullopt;

    return AttachmentFile{resolve_attachment_path(*filename), row.text("mime_type")};
}

} // namespace onthisday
