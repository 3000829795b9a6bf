/*
 * This file is part of PartsLabel.
 * Copyright (C) 2025 Luisma Peramato
 *
 * PartsLabel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PartsLabel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PartsLabel. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <wx/wx.h>
#include <wx/scrolwin.h>

// Read-only log of loads, generation runs and skipped locations
class ConsolePanel : public wxPanel
{
public:
    enum class MessageKind { Info, Warning, Error };

    explicit ConsolePanel(wxWindow* parent);

    void AppendMessage(const wxString& msg,
                       MessageKind kind = MessageKind::Info);
    // Separator line with the time a generation run started
    void BeginRun(const wxString& title);
    void Clear();

private:
    wxTextCtrl* m_textCtrl = nullptr;
    bool m_autoScroll = true;
    void OnScroll(wxScrollWinEvent& event);
};
