#ifndef APPLICATION_H
#define APPLICATION_H

#include <QApplication>

class Application : public QApplication {
    Q_OBJECT
public:
    Application(int &argc, char **argv);
    ~Application() override;

    bool isStorageReady() const;

private:
    bool m_storageReady;
};

#endif // APPLICATION_H
