#include "frame_store.h"

void frame_reader::release() {
  if (lk.owns_lock()) lk.unlock();
  st = read_status::no_frame_yet;
  ptr = nullptr;
  len = 0;
}

frame_store::write_scope::write_scope(frame_store *s) : store(s), gate(s->gate), lk(s->mtx) {}

void frame_store::pass_gate() const {
  std::lock_guard<std::mutex> lk(gate);
}

void frame_store::write_scope::commit(uint32_t bytes_used, uint32_t device_sequence, uint64_t captured_ms) {
  if (!store || !lk.owns_lock()) return;
  // Never advertise more bytes than the mapping holds.
  if (bytes_used > store->view.length) bytes_used = (uint32_t)store->view.length;
  store->meta_.bytes_used = bytes_used;
  store->meta_.device_sequence = device_sequence;
  store->meta_.captured_ms = captured_ms;
  store->meta_.sequence = store->next_seq++;
  store->have_frame = true;
}

void frame_store::attach(const buffer_view &v) {
  std::unique_lock<std::shared_mutex> lk(mtx);
  view = v;
  meta_ = frame_meta{};
  have_frame = false;
}

void frame_store::detach() {
  std::unique_lock<std::shared_mutex> lk(mtx);
  view = buffer_view{};
  meta_ = frame_meta{};
  have_frame = false;
}

frame_store::write_scope frame_store::begin_write() {
  return write_scope(this);
}

frame_reader frame_store::read_latest() const {
  frame_reader r;
  pass_gate();
  r.lk = std::shared_lock<std::shared_mutex>(mtx);
  if (!have_frame || !view.data) {
    r.lk.unlock();
    return r;
  }
  r.st = read_status::ok;
  r.ptr = view.data;
  r.len = meta_.bytes_used;
  r.m = meta_;
  return r;
}

read_status frame_store::copy_latest(std::string *out, frame_meta *meta) const {
  pass_gate();
  std::shared_lock<std::shared_mutex> lk(mtx);
  if (!have_frame || !view.data) return read_status::no_frame_yet;
  if (out) out->assign((const char*)view.data, meta_.bytes_used);
  if (meta) *meta = meta_;
  return read_status::ok;
}

read_status frame_store::latest_meta(frame_meta *meta) const {
  pass_gate();
  std::shared_lock<std::shared_mutex> lk(mtx);
  if (!have_frame) return read_status::no_frame_yet;
  if (meta) *meta = meta_;
  return read_status::ok;
}
