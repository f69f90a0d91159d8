#include "MainWindow.hpp"
#include "codetyper/generation/providers/InferenceProviderFactory.hpp"
#include <QApplication>
#include <QDebug>
#include <QtGlobal>
#include <exception>
#include <utility>

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setOrganizationName("CodeTyper");
    QApplication::setApplicationName("CodeTyper");

    const QString environmentKey = qEnvironmentVariable("CODETYPER_API_KEY");

    try
    {
        MainWindow window(
            [](codetyper::generation::providers::InferenceConfig config)
            { return codetyper::generation::providers::makeInferenceCodeProvider(std::move(config)); },
            environmentKey);
        window.show();

        return QApplication::exec();
    }
    catch (const std::exception& e)
    {
        qCritical() << "fatal:" << e.what();
        return 1;
    }
}
