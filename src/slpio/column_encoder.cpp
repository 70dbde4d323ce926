#include "column_encoder.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <redlog.hpp>

#include "slpbase/worker_pool.hpp"
#include "slpquery/model_view.hpp"

namespace slp::io {

namespace {

using format::format_version;

constexpr format_version k_base{0, 1, 0};

template <typename T> struct field_column {
  const char* name;
  column_type type;
  format_version since;
  bool (*fill)(column&, size_t, const T&); // false leaves the row null
};

struct column_job {
  std::string name;
  column_type type;
  std::function<void(column&)> fill;
};

template <typename T> bool put_int(column& out, size_t row, const std::optional<T>& value) {
  if (!value) {
    return false;
  }
  out.set_int(row, static_cast<int64_t>(*value));
  return true;
}

template <typename T> bool put_uint(column& out, size_t row, const std::optional<T>& value) {
  if (!value) {
    return false;
  }
  out.set_uint(row, static_cast<uint64_t>(*value));
  return true;
}

template <typename V, typename M> std::optional<M> member_of(const std::optional<V>& value, M V::*member) {
  return value ? std::optional<M>((*value).*member) : std::nullopt;
}

std::optional<uint8_t> misc_byte(const format::item_state& item, size_t index) {
  return item.misc ? std::optional<uint8_t>((*item.misc)[index]) : std::nullopt;
}

bool put_float(column& out, size_t row, const std::optional<float>& value) {
  if (!value) {
    return false;
  }
  out.set_float(row, *value);
  return true;
}

bool put_bool(column& out, size_t row, const std::optional<bool>& value) {
  if (!value) {
    return false;
  }
  out.set_bool(row, *value);
  return true;
}

const std::vector<field_column<format::pre_frame>>& pre_columns() {
  using T = format::pre_frame;
  using C = column_type;
  static const std::vector<field_column<T>> fields = {
      {"random_seed", C::u32, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.random_seed); return true; }},
      {"state", C::u16, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.state); return true; }},
      {"position.x", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.position.x); return true; }},
      {"position.y", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.position.y); return true; }},
      {"direction", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.direction); return true; }},
      {"joystick.x", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.joystick.x); return true; }},
      {"joystick.y", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.joystick.y); return true; }},
      {"cstick.x", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.cstick.x); return true; }},
      {"cstick.y", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.cstick.y); return true; }},
      {"triggers.logical", C::f32, k_base,
       [](column& c, size_t r, const T& v) { c.set_float(r, v.trigger.logical); return true; }},
      {"triggers.physical.l", C::f32, k_base,
       [](column& c, size_t r, const T& v) { c.set_float(r, v.trigger.physical.l); return true; }},
      {"triggers.physical.r", C::f32, k_base,
       [](column& c, size_t r, const T& v) { c.set_float(r, v.trigger.physical.r); return true; }},
      {"buttons.logical", C::u32, k_base,
       [](column& c, size_t r, const T& v) { c.set_uint(r, v.button.logical); return true; }},
      {"buttons.physical", C::u16, k_base,
       [](column& c, size_t r, const T& v) { c.set_uint(r, v.button.physical); return true; }},
      {"raw_analog_x", C::i8, {1, 2, 0}, [](column& c, size_t r, const T& v) { return put_int(c, r, v.raw_analog_x); }},
      {"damage", C::f32, {1, 4, 0}, [](column& c, size_t r, const T& v) { return put_float(c, r, v.damage); }},
      {"raw_analog_y", C::i8, {3, 15, 0}, [](column& c, size_t r, const T& v) { return put_int(c, r, v.raw_analog_y); }},
  };
  return fields;
}

const std::vector<field_column<format::post_frame>>& post_columns() {
  using T = format::post_frame;
  using V = format::velocities;
  using C = column_type;
  static const std::vector<field_column<T>> fields = {
      {"character", C::u8, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.character); return true; }},
      {"state", C::u16, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.state); return true; }},
      {"position.x", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.position.x); return true; }},
      {"position.y", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.position.y); return true; }},
      {"direction", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.direction); return true; }},
      {"damage", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.damage); return true; }},
      {"shield", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.shield); return true; }},
      {"last_attack_landed", C::u8, k_base,
       [](column& c, size_t r, const T& v) { c.set_uint(r, v.last_attack_landed); return true; }},
      {"combo_count", C::u8, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.combo_count); return true; }},
      {"last_hit_by", C::u8, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.last_hit_by); return true; }},
      {"stocks", C::u8, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.stocks); return true; }},
      {"state_age", C::f32, {0, 2, 0}, [](column& c, size_t r, const T& v) { return put_float(c, r, v.state_age); }},
      {"flags", C::u64, {2, 0, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, v.flags); }},
      {"misc_as", C::f32, {2, 0, 0}, [](column& c, size_t r, const T& v) { return put_float(c, r, v.misc_as); }},
      {"airborne", C::boolean, {2, 0, 0}, [](column& c, size_t r, const T& v) { return put_bool(c, r, v.airborne); }},
      {"ground", C::u16, {2, 0, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, v.ground); }},
      {"jumps", C::u8, {2, 0, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, v.jumps); }},
      {"l_cancel", C::u8, {2, 0, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, v.l_cancel); }},
      {"hurtbox_state", C::u8, {2, 1, 0},
       [](column& c, size_t r, const T& v) { return put_uint(c, r, v.hurtbox_state); }},
      {"velocities.self_x_air", C::f32, {3, 5, 0},
       [](column& c, size_t r, const T& v) { return put_float(c, r, member_of(v.velocity, &V::self_x_air)); }},
      {"velocities.self_y", C::f32, {3, 5, 0},
       [](column& c, size_t r, const T& v) { return put_float(c, r, member_of(v.velocity, &V::self_y)); }},
      {"velocities.knockback_x", C::f32, {3, 5, 0},
       [](column& c, size_t r, const T& v) { return put_float(c, r, member_of(v.velocity, &V::knockback_x)); }},
      {"velocities.knockback_y", C::f32, {3, 5, 0},
       [](column& c, size_t r, const T& v) { return put_float(c, r, member_of(v.velocity, &V::knockback_y)); }},
      {"velocities.self_x_ground", C::f32, {3, 5, 0},
       [](column& c, size_t r, const T& v) { return put_float(c, r, member_of(v.velocity, &V::self_x_ground)); }},
      {"hitlag", C::f32, {3, 8, 0}, [](column& c, size_t r, const T& v) { return put_float(c, r, v.hitlag); }},
      {"animation_index", C::u32, {3, 11, 0},
       [](column& c, size_t r, const T& v) { return put_uint(c, r, v.animation_index); }},
  };
  return fields;
}

const std::vector<field_column<format::item_state>>& item_columns() {
  using T = format::item_state;
  using C = column_type;
  static const std::vector<field_column<T>> fields = {
      {"type", C::u16, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.type); return true; }},
      {"state", C::u8, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.state); return true; }},
      {"direction", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.direction); return true; }},
      {"velocity.x", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.velocity.x); return true; }},
      {"velocity.y", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.velocity.y); return true; }},
      {"position.x", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.position.x); return true; }},
      {"position.y", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.position.y); return true; }},
      {"damage", C::u16, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.damage); return true; }},
      {"timer", C::f32, k_base, [](column& c, size_t r, const T& v) { c.set_float(r, v.timer); return true; }},
      {"id", C::u32, k_base, [](column& c, size_t r, const T& v) { c.set_uint(r, v.id); return true; }},
      {"misc.0", C::u8, {3, 2, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, misc_byte(v, 0)); }},
      {"misc.1", C::u8, {3, 2, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, misc_byte(v, 1)); }},
      {"misc.2", C::u8, {3, 2, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, misc_byte(v, 2)); }},
      {"misc.3", C::u8, {3, 2, 0}, [](column& c, size_t r, const T& v) { return put_uint(c, r, misc_byte(v, 3)); }},
      {"owner", C::i8, {3, 6, 0}, [](column& c, size_t r, const T& v) { return put_int(c, r, v.owner); }},
  };
  return fields;
}

template <typename T>
void add_slot_columns(
    std::vector<column_job>& jobs, const game::replay& replay, const std::vector<field_column<T>>& fields,
    const std::string& prefix, size_t slot, bool follower, std::optional<T> game::character_data::*member
) {
  const auto& frames = replay.frames;
  for (const auto& field : fields) {
    if (replay.version() < field.since) {
      continue;
    }
    jobs.push_back({prefix + field.name, field.type, [&frames, slot, follower, member, fill = field.fill](column& out) {
                      for (size_t row = 0; row < frames.size(); ++row) {
                        const auto& port = frames[row].ports[slot];
                        const game::character_data* data = &port.leader;
                        if (follower) {
                          data = port.follower ? &*port.follower : nullptr;
                        }
                        if (!data || !(data->*member) || !fill(out, row, *(data->*member))) {
                          out.set_null(row);
                        }
                      }
                    }});
  }
}

status materialize(std::vector<column_job> jobs, size_t rows, size_t workers, column_table& out) {
  column_table table;
  table.rows = rows;
  table.columns.resize(jobs.size());
  util::run_indexed(jobs.size(), workers, [&](size_t index) {
    column built(jobs[index].name, jobs[index].type, rows);
    jobs[index].fill(built);
    table.columns[index] = std::move(built);
  });
  out = std::move(table);
  return ok_status();
}

} // namespace

status build_frame_table(const game::replay& replay, size_t workers, column_table& out) {
  const auto& frames = replay.frames;
  const auto version = replay.version();
  std::vector<column_job> jobs;

  jobs.push_back({"index", column_type::i32, [&frames](column& col) {
                    for (size_t row = 0; row < frames.size(); ++row) {
                      col.set_int(row, frames[row].index);
                    }
                  }});
  if (version >= format_version{2, 2, 0}) {
    jobs.push_back({"start.random_seed", column_type::u32, [&frames](column& col) {
                      for (size_t row = 0; row < frames.size(); ++row) {
                        if (frames[row].start) {
                          col.set_uint(row, frames[row].start->random_seed);
                        } else {
                          col.set_null(row);
                        }
                      }
                    }});
  }
  if (version >= format_version{3, 10, 0}) {
    jobs.push_back({"start.scene_frame_counter", column_type::u32, [&frames](column& col) {
                      for (size_t row = 0; row < frames.size(); ++row) {
                        if (!frames[row].start || !put_uint(col, row, frames[row].start->scene_frame_counter)) {
                          col.set_null(row);
                        }
                      }
                    }});
  }
  if (version >= format_version{3, 7, 0}) {
    jobs.push_back({"end.latest_finalized_frame", column_type::i32, [&frames](column& col) {
                      for (size_t row = 0; row < frames.size(); ++row) {
                        if (!frames[row].end || !put_int(col, row, frames[row].end->latest_finalized_frame)) {
                          col.set_null(row);
                        }
                      }
                    }});
  }

  for (size_t slot = 0; slot < replay.start.players.size(); ++slot) {
    const std::string port = query::port_name(replay.start.players[slot].port);
    bool has_follower = false;
    for (const auto& target : frames) {
      if (target.ports[slot].follower) {
        has_follower = true;
        break;
      }
    }

    add_slot_columns(jobs, replay, pre_columns(), port + ".leader.pre.", slot, false, &game::character_data::pre);
    add_slot_columns(jobs, replay, post_columns(), port + ".leader.post.", slot, false, &game::character_data::post);
    if (has_follower) {
      add_slot_columns(jobs, replay, pre_columns(), port + ".follower.pre.", slot, true, &game::character_data::pre);
      add_slot_columns(jobs, replay, post_columns(), port + ".follower.post.", slot, true, &game::character_data::post);
    }
  }

  auto log = redlog::get_logger("slpkit.columns");
  log.dbg("frame columns planned", redlog::field("columns", jobs.size()), redlog::field("rows", frames.size()));
  return materialize(std::move(jobs), frames.size(), workers, out);
}

status build_item_table(const game::replay& replay, size_t workers, column_table& out) {
  std::vector<int32_t> frame_indices;
  std::vector<const format::item_state*> items;
  for (const auto& target : replay.frames) {
    for (const auto& item : target.items) {
      frame_indices.push_back(target.index);
      items.push_back(&item);
    }
  }

  std::vector<column_job> jobs;
  jobs.push_back({"frame", column_type::i32, [&frame_indices](column& col) {
                    for (size_t row = 0; row < frame_indices.size(); ++row) {
                      col.set_int(row, frame_indices[row]);
                    }
                  }});
  for (const auto& field : item_columns()) {
    if (replay.version() < field.since) {
      continue;
    }
    jobs.push_back({field.name, field.type, [&items, fill = field.fill](column& col) {
                      for (size_t row = 0; row < items.size(); ++row) {
                        if (!fill(col, row, *items[row])) {
                          col.set_null(row);
                        }
                      }
                    }});
  }
  return materialize(std::move(jobs), items.size(), workers, out);
}

status encode_frame_table(const game::replay& replay, const columnar_options& options, std::vector<uint8_t>& out) {
  column_table table;
  auto st = build_frame_table(replay, options.workers, table);
  if (!st.ok()) {
    return st;
  }
  return write_arrow_file(table, {options.codec, options.compression_level, options.workers}, out);
}

status encode_item_table(const game::replay& replay, const columnar_options& options, std::vector<uint8_t>& out) {
  column_table table;
  auto st = build_item_table(replay, options.workers, table);
  if (!st.ok()) {
    return st;
  }
  return write_arrow_file(table, {options.codec, options.compression_level, options.workers}, out);
}

} // namespace slp::io
