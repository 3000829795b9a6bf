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
#include "logger.h"
#include "mainwindow.h"
#include <wx/wx.h>

class PartsLabelApp : public wxApp {
public:
  virtual bool OnInit() override;
};

wxIMPLEMENT_APP(PartsLabelApp);

bool PartsLabelApp::OnInit() {
  // Initialize logging system (overwrites log file each launch)
  Logger::Instance();

  MainWindow *mainWindow = new MainWindow("PartsLabel");
  mainWindow->Show(true);

  // A part list given on the command line is loaded right away
  if (argc > 1)
    mainWindow->LoadTableFromPath(argv[1].ToStdString(wxConvUTF8));

  return true;
}
