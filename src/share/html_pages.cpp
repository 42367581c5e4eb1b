#include "puresend/share/html_pages.hpp"
#include <sstream>

namespace puresend::share::pages {

namespace {
    const char* STYLE = R"(<style>
body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif; max-width: 720px; margin: 40px auto; padding: 0 20px; color: #333; }
h1 { font-size: 1.6em; }
ul { list-style: none; padding: 0; }
li { padding: 10px 0; border-bottom: 1px solid #eee; }
a { color: #1976d2; text-decoration: none; }
.note { background: #fff3cd; padding: 10px; border-radius: 4px; }
.muted { color: #999; }
.error { color: #d32f2f; }
input, button { font-size: 1em; padding: 8px; }
progress { width: 100%; }
</style>)";

    std::string page(const std::string& title, const std::string& body) {
        std::ostringstream out;
        out << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"UTF-8\">\n"
            << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
            << "<title>PureSend - " << title << "</title>\n" << STYLE << "\n</head>\n<body>\n"
            << body << "\n</body>\n</html>\n";
        return out.str();
    }

    std::string escape(const std::string& text) {
        std::string escaped;
        for (char c : text) {
            switch (c) {
                case '<': escaped += "&lt;"; break;
                case '>': escaped += "&gt;"; break;
                case '&': escaped += "&amp;"; break;
                case '"': escaped += "&quot;"; break;
                default: escaped.push_back(c);
            }
        }
        return escaped;
    }
}

std::string share_files() {
    return page("Shared files", R"(<h1>Shared files</h1>
<p class="note">Only open this link on a network you trust.</p>
<ul id="files"><li class="muted">Loading...</li></ul>
<script>
function formatSize(bytes) {
  if (bytes === 0) return '0 B';
  var units = ['B', 'KB', 'MB', 'GB', 'TB'];
  var i = Math.floor(Math.log(bytes) / Math.log(1024));
  return (bytes / Math.pow(1024, i)).toFixed(2) + ' ' + units[i];
}
var last = '';
function refresh() {
  fetch('/files').then(function(r) { return r.json(); }).then(function(data) {
    var json = JSON.stringify(data.files);
    if (json === last) return;
    last = json;
    var list = document.getElementById('files');
    if (!data.files || data.files.length === 0) {
      list.innerHTML = '<li class="muted">No files available</li>';
      return;
    }
    list.innerHTML = data.files.map(function(f) {
      var link = document.createElement('a');
      link.href = '/download/' + encodeURIComponent(f.id);
      link.textContent = f.name;
      return '<li>' + link.outerHTML + ' (' + formatSize(f.size) + ')</li>';
    }).join('');
  }).catch(function() {});
}
refresh();
setInterval(refresh, 1000);
</script>)");
}

std::string share_pin() {
    return page("PIN required", R"(<h1>Enter the PIN</h1>
<p>The sender protected this share with a PIN.</p>
<form id="form"><input id="pin" inputmode="numeric" autocomplete="off" autofocus>
<button type="submit">Open</button></form>
<p id="status" class="error"></p>
<script>
document.getElementById('form').addEventListener('submit', function(e) {
  e.preventDefault();
  fetch('/verify-pin', {
    method: 'POST',
    headers: {'Content-Type': 'application/json'},
    body: JSON.stringify({pin: document.getElementById('pin').value})
  }).then(function(r) { return r.json(); }).then(function(result) {
    if (result.success || result.locked) { window.location.reload(); return; }
    document.getElementById('status').textContent =
      'Wrong PIN, ' + result.remaining_attempts + ' attempt(s) left';
  });
});
</script>)");
}

std::string share_locked(std::uint64_t remaining_seconds) {
    std::ostringstream body;
    body << "<h1>Access locked</h1>\n<p>Too many wrong PINs. Try again in <span id=\"left\">"
         << remaining_seconds << "</span> s.</p>\n"
         << "<script>\nvar left = " << remaining_seconds << ";\n"
         << "setInterval(function() {\n  left--;\n  if (left <= 0) { window.location.reload(); return; }\n"
         << "  document.getElementById('left').textContent = left;\n}, 1000);\n</script>";
    return page("Locked", body.str());
}

std::string upload_form(std::uint32_t chunk_size) {
    std::ostringstream body;
    body << R"(<h1>Send files to this device</h1>
<input type="file" id="picker" multiple>
<button id="send">Upload</button>
<ul id="uploads"></ul>
<script>
var CHUNK_SIZE = )" << chunk_size << R"(;
function row(name) {
  var li = document.createElement('li');
  li.innerHTML = '<div></div><progress max="100" value="0"></progress>';
  li.firstChild.textContent = name;
  document.getElementById('uploads').appendChild(li);
  return li.lastChild;
}
async function upload(file) {
  var bar = row(file.name);
  var init = await fetch('/upload/init', {
    method: 'POST',
    headers: {'Content-Type': 'application/json'},
    body: JSON.stringify({fileName: file.name, fileSize: file.size, chunkSize: CHUNK_SIZE})
  }).then(function(r) { return r.json(); });
  if (!init.success) { bar.outerHTML = '<span class="error">' + (init.message || 'Refused') + '</span>'; return; }
  for (var i = 0; i < init.chunkCount; i++) {
    var blob = file.slice(i * init.chunkSize, Math.min(file.size, (i + 1) * init.chunkSize));
    var result = await fetch('/upload/chunk', {
      method: 'POST',
      headers: {'x-upload-id': init.uploadId, 'x-chunk-index': String(i)},
      body: blob
    }).then(function(r) { return r.json(); });
    if (!result.success) { bar.outerHTML = '<span class="error">' + result.message + '</span>'; return; }
    bar.value = Math.round(100 * (i + 1) / init.chunkCount);
  }
  if (init.chunkCount === 0) bar.value = 100;
}
document.getElementById('send').addEventListener('click', async function() {
  var files = document.getElementById('picker').files;
  for (var i = 0; i < files.length; i++) { await upload(files[i]); }
});
</script>)";
    return page("Upload", body.str());
}

std::string waiting() {
    return page("Waiting", R"(<h1>Waiting for approval</h1>
<p>The owner of this device has to accept your request.</p>
<script>
setInterval(function() {
  fetch('/request-status').then(function(r) { return r.json(); }).then(function(s) {
    if (s.status === 'accepted' || s.status === 'rejected') window.location.reload();
  }).catch(function() {});
}, 2000);
</script>)");
}

std::string rejected() {
    return page("Rejected", "<h1>Access denied</h1>\n<p>The owner of this device rejected your request.</p>");
}

std::string message(const std::string& title, const std::string& text) {
    return page(escape(title), "<h1>" + escape(title) + "</h1>\n<p>" + escape(text) + "</p>");
}

} // namespace puresend::share::pages
