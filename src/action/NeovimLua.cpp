#include "action/NeovimLua.h"

namespace {
// 按规范路径查找缓冲区，供下面几个脚本共用
const char* FIND_BUFFER_LUA = R"(
local function sidekick_find_buf(target)
  local uv = vim.uv or vim.loop
  for _, buf in ipairs(vim.api.nvim_list_bufs()) do
    local name = vim.api.nvim_buf_get_name(buf)
    if name ~= '' and (uv.fs_realpath(name) or name) == target then
      return buf
    end
  end
  return nil
end
)";
}

namespace NeovimLua {

const std::string& bufferStatusScript() {
    static const std::string script = std::string(FIND_BUFFER_LUA) + R"(
local buf = sidekick_find_buf(...)
if not buf then
  return { is_current = false, has_unsaved_changes = false }
end
return {
  is_current = buf == vim.api.nvim_get_current_buf(),
  has_unsaved_changes = vim.bo[buf].modified,
}
)";
    return script;
}

const std::string& refreshBufferScript() {
    static const std::string script = std::string(FIND_BUFFER_LUA) + R"(
local buf = sidekick_find_buf(...)
if not buf then
  return true
end

-- 保存所有显示该缓冲区的窗口的视图 (光标、滚动位置)
local views = {}
for _, win in ipairs(vim.api.nvim_list_wins()) do
  if vim.api.nvim_win_get_buf(win) == buf then
    views[win] = vim.api.nvim_win_call(win, function() return vim.fn.winsaveview() end)
  end
end

-- checktime 触发文件变更检测，edit 从磁盘重新加载
local ok = pcall(vim.api.nvim_buf_call, buf, function()
  vim.cmd('checktime')
  vim.cmd('edit')
end)

for win, view in pairs(views) do
  if vim.api.nvim_win_is_valid(win) then
    pcall(vim.api.nvim_win_call, win, function() vim.fn.winrestview(view) end)
  end
end

if vim.api.nvim_get_current_buf() == buf then
  vim.cmd('redraw')
end
return ok
)";
    return script;
}

const std::string& notifyScript() {
    static const std::string script = R"(
vim.notify(..., vim.log.levels.WARN)
return true
)";
    return script;
}

const std::string& visualSelectionScript() {
    static const std::string script = R"(
local mode = vim.api.nvim_get_mode().mode:sub(1, 1)
if mode ~= 'v' and mode ~= 'V' and mode ~= '\22' then
  return nil
end

local buf = vim.api.nvim_get_current_buf()
local name = vim.api.nvim_buf_get_name(buf)
if name == '' then
  return nil
end

local s = vim.fn.getpos('v')
local e = vim.fn.getpos('.')
local srow, scol, erow, ecol = s[2], s[3], e[2], e[3]
if srow > erow or (srow == erow and scol > ecol) then
  srow, scol, erow, ecol = erow, ecol, srow, scol
end

local lines = vim.api.nvim_buf_get_lines(buf, srow - 1, erow, false)
if #lines == 0 then
  return nil
end
-- 字符选择裁剪首尾列；行选择与块选择按整行返回
-- getpos 给出的是末字符的首字节列，需延伸到该字符的最后一个字节
if mode == 'v' then
  local last = lines[#lines]
  local ch = vim.fn.matchstr(last, '.', ecol - 1)
  lines[#lines] = last:sub(1, ecol + math.max(#ch, 1) - 1)
  lines[1] = lines[1]:sub(scol)
end

local content = table.concat(lines, '\n')
if content == '' then
  return nil
end

local uv = vim.uv or vim.loop
return {
  file_path = uv.fs_realpath(name) or name,
  start_line = srow,
  end_line = erow,
  content = content,
}
)";
    return script;
}

} // namespace NeovimLua
